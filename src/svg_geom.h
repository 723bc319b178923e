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
#include <badgecut.hpp>

namespace badgecut {

    std::string format_number(double value, int digits);
    int local_precision(xform2d mat, int digits);

    bool bounds_overlap(const d2p &a_min, const d2p &a_max, const d2p &b_min, const d2p &b_max, double margin=0.0);

    enum FillRule svg_fill_rule(const std::string &val);
    enum JoinStyle svg_join_style(const std::string &val);
    enum CapStyle svg_cap_style(const std::string &val);

    void rect_polygon(double x, double y, double w, double h, Polygon &out);
    double polygon_area(const Polygon &poly);
    double polygon_length(const Polygon &poly, bool closed);

} /* namespace badgecut */
