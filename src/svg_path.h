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

#include <vector>
#include <badgecut.hpp>
#include "geom2d.hpp"

namespace badgecut {
/* Parse SVG path data into shape contours, flattening curves and arcs to the given tolerance. Subpaths ending in a
 * closepath become closed contours, all others open contours. false -> syntax error, out contains everything up to the
 * error (which is what SVG renderers display). */
bool parse_path_data(const char *data, double tolerance, Shape &out);
int count_subpaths(const char *data);
void dash_path(const Polygon &in, std::vector<Polygon> &out, const std::vector<double> &dasharray, double dash_offset=0.0);
}
