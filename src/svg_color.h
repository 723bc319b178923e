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

#pragma once

#include <string>
#include <vector>
#include <pugixml.hpp>
#include <badgecut.hpp>

namespace badgecut {

/* Resolved paint properties of an element after CSS-style inheritance from its ancestors. */
class PaintStyle {
public:
    std::string fill = "black";
    std::string stroke = "none";
    std::string stroke_opacity; /* empty -> opaque */
    double stroke_width = 1.0;
    JoinStyle join = JOIN_MITER;
    CapStyle cap = CAP_BUTT;
    double miter_limit = 4.0;
    FillRule fill_rule = FILL_NONZERO;
    std::vector<double> dasharray;
    double dash_offset = 0.0;
    bool visible = true;

    PaintStyle inherit(const pugi::xml_node &node) const;

    bool has_fill() const;
    bool has_stroke() const;
    StrokeStyle stroke_style() const;
};

bool svg_paint_visible(const std::string &paint);
bool svg_display_none(const pugi::xml_node &node);

} /* namespace badgecut */
