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

#include "svg_color.h"
#include "svg_geom.h"
#include "svg_import_util.h"

#include <string>
#include <cmath>

using namespace badgecut;
using namespace std;

/* Map an SVG fill or stroke definition to whether anything gets painted. Colors, currentColor and paint server
 * references all paint. */
bool badgecut::svg_paint_visible(const string &paint) {
    return !(paint == "none" || paint == "transparent");
}

bool badgecut::svg_display_none(const pugi::xml_node &node) {
    return svg_prop(node, "display") == "none";
}

PaintStyle badgecut::PaintStyle::inherit(const pugi::xml_node &node) const {
    PaintStyle out(*this);

    string val = svg_prop(node, "fill");
    if (!val.empty() && val != "inherit")
        out.fill = val;

    val = svg_prop(node, "stroke");
    if (!val.empty() && val != "inherit")
        out.stroke = val;

    val = svg_prop(node, "stroke-opacity");
    if (!val.empty() && val != "inherit")
        out.stroke_opacity = val;

    val = svg_prop(node, "stroke-width");
    if (!val.empty() && val != "inherit" && val.back() != '%')
        out.stroke_width = atof(val.c_str());

    /* bevel joins are approximated by Clipper's square join, see clipper_join_type */
    val = svg_prop(node, "stroke-linejoin");
    if (!val.empty() && val != "inherit")
        out.join = svg_join_style(val);

    val = svg_prop(node, "stroke-linecap");
    if (!val.empty() && val != "inherit")
        out.cap = svg_cap_style(val);

    val = svg_prop(node, "stroke-miterlimit");
    if (!val.empty() && val != "inherit")
        out.miter_limit = fmax(1.0, atof(val.c_str()));

    val = svg_prop(node, "fill-rule");
    if (!val.empty() && val != "inherit")
        out.fill_rule = svg_fill_rule(val);

    val = svg_prop(node, "stroke-dasharray");
    if (!val.empty() && val != "inherit") {
        parse_number_list(val, out.dasharray);

        double sum = 0.0;
        bool negative = false;
        for (double d : out.dasharray) {
            sum += d;
            negative |= d < 0.0;
        }

        /* Invalid or all-zero arrays render as a solid stroke */
        if (negative || sum <= 0.0) {
            out.dasharray.clear();
        }

        /* An odd number of values is repeated to yield an even number */
        if (out.dasharray.size() % 2 == 1) {
            vector<double> copy(out.dasharray);
            out.dasharray.insert(out.dasharray.end(), copy.begin(), copy.end());
        }
    }

    val = svg_prop(node, "stroke-dashoffset");
    if (!val.empty() && val != "inherit")
        out.dash_offset = atof(val.c_str());

    val = svg_prop(node, "visibility");
    if (val == "hidden" || val == "collapse")
        out.visible = false;
    else if (val == "visible")
        out.visible = true;

    return out;
}

bool badgecut::PaintStyle::has_fill() const {
    return svg_paint_visible(fill);
}

bool badgecut::PaintStyle::has_stroke() const {
    return svg_paint_visible(stroke) && stroke_width > 0.0;
}

StrokeStyle badgecut::PaintStyle::stroke_style() const {
    StrokeStyle s;
    s.width = stroke_width;
    s.join = join;
    s.cap = cap;
    s.miter_limit = miter_limit;
    return s;
}
