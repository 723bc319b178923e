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
#include <sstream>
#include <iostream>

#include <badgecut.hpp>
#include "svg_geom.h"
#include "svg_import_util.h"

using namespace badgecut;
using namespace std;

namespace {

/* Canvas box from the root element's opening tag, without parsing the document */
void canvas_box(const string &tag, double &x, double &y, double &w, double &h) {
    x = y = 0.0;
    w = h = 16.0;

    static const regex vb_re("\\sviewBox\\s*=\\s*[\"']([^\"']+)[\"']");
    smatch m;
    if (regex_search(tag, m, vb_re)) {
        vector<double> vb;
        parse_number_list(m.str(1), vb);
        if (vb.size() == 4 && vb[2] > 0.0 && vb[3] > 0.0) {
            x = vb[0];
            y = vb[1];
            w = vb[2];
            h = vb[3];
            return;
        }
    }

    static const regex w_re("\\swidth\\s*=\\s*[\"']\\s*([0-9.]+)");
    static const regex h_re("\\sheight\\s*=\\s*[\"']\\s*([0-9.]+)");
    smatch mw, mh;
    if (regex_search(tag, mw, w_re) && regex_search(tag, mh, h_re)) {
        double pw = atof(mw.str(1).c_str()), ph = atof(mh.str(1).c_str());
        if (pw > 0.0 && ph > 0.0) {
            w = pw;
            h = ph;
        }
    }
}

string xml_escape_attr(const string &val) {
    string out;
    for (char c : val) {
        switch (c) {
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            default: out += c;
        }
    }
    return out;
}

} /* anonymous namespace */

string badgecut::ClipRectCompositor::apply(const string &svg, const vector<BadgeDescriptor> &badges) {
    m_stats = CompositeStats();
    if (badges.empty())
        return svg;

    static const regex open_re("<svg\\b[^>]*>", regex::icase);
    smatch m;
    if (!regex_search(svg, m, open_re) || m.str(0).find("/>") != string::npos || svg.rfind("</svg>") == string::npos) {
        cerr << "Warning: Icon markup has no root <svg> element with content, returning it without badges" << endl;
        m_stats.badges_skipped = (int)badges.size();
        return svg;
    }

    string out = svg;
    int pass = 0;
    int layers = 0;

    for (size_t idx : paint_order(badges)) {
        const BadgeDescriptor &badge = badges[idx];

        /* Earlier passes only insert after the opening tag, so these still exist */
        if (!regex_search(out, m, open_re))
            break;
        string tag = m.str(0);
        size_t open_end = m.position(0) + m.length(0);
        size_t close = out.rfind("</svg>");

        double cx, cy, cw, ch;
        canvas_box(tag, cx, cy, cw, ch);

        Anchor anchor;
        if (!parse_anchor(badge.anchor, anchor)) {
            cerr << "Warning: Unknown anchor \"" << badge.anchor << "\" for badge " << idx << ", using br" << endl;
        }

        BadgePlacement placement = compute_badge_placement(badge.svg, cw,
                badge.x_offset, badge.y_offset, badge.scale, anchor, {cx, cy});
        if (placement.inner.empty()) {
            cerr << "Warning: Badge " << idx << " has no content, skipping" << endl;
            m_stats.badges_skipped++;
            continue;
        }

        /* Badge bounding box on the canvas, grown by gap */
        double gap = badge.gap;
        double bx = placement.tx + placement.min_x * placement.scale - gap;
        double by = placement.ty + placement.min_y * placement.scale - gap;
        double bw = placement.badge_w * placement.scale + 2*gap;
        double bh = placement.badge_h * placement.scale + 2*gap;

        int digits = m_settings.precision;
        auto num = [digits](double v) { return format_number(v, digits); };
        ostringstream keep;
        keep << "M" << num(cx) << " " << num(cy) << "H" << num(cx + cw) << "V" << num(cy + ch) << "H" << num(cx) << "Z"
            << "M" << num(bx) << " " << num(by) << "H" << num(bx + bw) << "V" << num(by + bh) << "H" << num(bx) << "Z";

        string id = m_settings.clip_id_prefix + to_string(pass);
        for (int i=1; out.find("id=\"" + id + "\"") != string::npos; i++) {
            id = m_settings.clip_id_prefix + to_string(pass) + "_" + to_string(i);
        }

        ostringstream clip;
        clip << "<defs><clipPath id=\"" << id << "\"><path d=\"" << keep.str() << "\" clip-rule=\"evenodd\"/>"
            << "</clipPath></defs><g clip-path=\"url(#" << id << ")\">";

        ostringstream layer;
        layer << "</g><g transform=\"" << placement.transform_str(digits) << "\" data-badge=\"" << idx << "\"";
        for (const auto &attr : placement.root_paint) {
            layer << " " << attr.first << "=\"" << xml_escape_attr(attr.second) << "\"";
        }
        layer << ">" << placement.inner << "</g>";

        /* Insert the closing part first, it does not move the opening tag */
        out.insert(close, layer.str());
        out.insert(open_end, clip.str());

        if (m_settings.verbose) {
            cerr << "Info: Badge " << idx << " at " << placement.transform_str(digits) << ", rectangular cutout "
                << num(bw) << " x " << num(bh) << endl;
        }

        m_stats.layers_clipped += layers;
        m_stats.badges_applied++;
        layers++;
        pass++;
    }

    return out;
}
