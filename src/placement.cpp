/*
 * This file is part of badgecut, a vector icon badge compositing toolchain
 * Copyright (C) 2021 Jan Sebastian Götte <gerbolyze@jaseg.de>
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 * 
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include <cmath>
#include <regex>
#include <string>
#include <sstream>
#include <iostream>
#include <algorithm>

#include <badgecut.hpp>
#include "svg_geom.h"
#include "svg_import_util.h"

using namespace badgecut;
using namespace std;

const vector<string> badgecut::anchor_names {"tl", "t", "tr", "l", "c", "r", "bl", "b", "br"};

bool badgecut::parse_anchor(const string &name, Anchor &out) {
    static const map<string, Anchor> long_names {
        {"top-left",     {0.0, 0.0}},
        {"top",          {0.5, 0.0}},
        {"top-right",    {1.0, 0.0}},
        {"left",         {0.0, 0.5}},
        {"center",       {0.5, 0.5}},
        {"right",        {1.0, 0.5}},
        {"bottom-left",  {0.0, 1.0}},
        {"bottom",       {0.5, 1.0}},
        {"bottom-right", {1.0, 1.0}},
    };

    auto short_name = std::find(anchor_names.begin(), anchor_names.end(), name);
    if (short_name != anchor_names.end()) {
        size_t idx = short_name - anchor_names.begin();
        out.ax = (idx % 3) * 0.5;
        out.ay = (idx / 3) * 0.5;
        return true;
    }

    auto it = long_names.find(name);
    if (it != long_names.end()) {
        out = it->second;
        return true;
    }

    out = Anchor();
    return false;
}

xform2d badgecut::BadgePlacement::mat() const {
    xform2d xf;
    xf.translate(tx, ty);
    xf.scale(scale, scale);
    return xf;
}

string badgecut::BadgePlacement::transform_str(int digits) const {
    ostringstream os;
    os << "translate(" << format_number(tx, digits) << " " << format_number(ty, digits) << ") "
        << "scale(" << format_number(scale, digits + 1) << ")";
    return os.str();
}

/* Opening tag of the badge's root <svg> element, or an empty string */
static string svg_open_tag(const string &svg, size_t &end_pos) {
    static const regex open_re("<svg\\b[^>]*>", regex::icase);
    smatch m;
    if (!regex_search(svg, m, open_re)) {
        end_pos = string::npos;
        return "";
    }
    end_pos = m.position(0) + m.length(0);
    return m.str(0);
}

static bool dimension_attr(const string &tag, const char *name, double &out) {
    regex re(string("\\s") + name + "\\s*=\\s*[\"']\\s*([0-9.]+)");
    smatch m;
    if (!regex_search(tag, m, re))
        return false;

    double val = atof(m.str(1).c_str());
    if (!(val > 0.0))
        return false;
    out = val;
    return true;
}

BadgePlacement badgecut::compute_badge_placement(const string &badge_svg, double viewbox_size,
        double x_off, double y_off, double user_scale, const Anchor &anchor, d2p origin) {
    BadgePlacement out;

    size_t tag_end;
    string tag = svg_open_tag(badge_svg, tag_end);

    /* Native badge box: viewBox, then width/height, then 16x16 */
    static const regex vb_re("\\bviewBox\\s*=\\s*[\"']([^\"']+)[\"']");
    smatch m;
    bool have_viewbox = false;
    if (regex_search(tag, m, vb_re)) {
        vector<double> parts;
        parse_number_list(m.str(1), parts);
        if (parts.size() == 4 && parts[2] > 0.0 && parts[3] > 0.0) {
            out.min_x = parts[0];
            out.min_y = parts[1];
            out.badge_w = parts[2];
            out.badge_h = parts[3];
            have_viewbox = true;
        }
    }

    if (!have_viewbox) {
        dimension_attr(tag, "width", out.badge_w);
        dimension_attr(tag, "height", out.badge_h);
    }

    double target = viewbox_size * 0.375;
    double fit_scale = fmin(target / out.badge_w, target / out.badge_h);
    out.scale = fit_scale * user_scale;

    out.tx = origin[0] + anchor.ax * viewbox_size - anchor.ax * out.badge_w * out.scale - out.min_x * out.scale + x_off;
    out.ty = origin[1] + anchor.ay * viewbox_size - anchor.ay * out.badge_h * out.scale - out.min_y * out.scale + y_off;

    static const char *paint_attrs[] = {
        "fill", "fill-opacity", "fill-rule", "stroke", "stroke-width", "stroke-linecap", "stroke-linejoin",
        "stroke-miterlimit", "stroke-dasharray", "stroke-dashoffset", "stroke-opacity", "color", "opacity",
    };
    for (const char *name : paint_attrs) {
        regex attr_re(string("\\s") + name + "\\s*=\\s*(?:\"([^\"]*)\"|'([^']*)')");
        if (regex_search(tag, m, attr_re))
            out.root_paint.emplace_back(name, m[1].matched ? m.str(1) : m.str(2));
    }

    /* Inner markup between the root's tags. A self-closing root has none. */
    if (tag_end != string::npos && !(tag.size() >= 2 && tag[tag.size() - 2] == '/')) {
        size_t close = badge_svg.rfind("</svg>");
        if (close != string::npos && close >= tag_end) {
            string inner = badge_svg.substr(tag_end, close - tag_end);
            size_t first = inner.find_first_not_of(" \t\r\n");
            size_t last = inner.find_last_not_of(" \t\r\n");
            if (first != string::npos)
                out.inner = inner.substr(first, last - first + 1);
        }
    }

    return out;
}
