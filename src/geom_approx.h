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

namespace badgecut {

/* Union of all given shapes, reduced pairwise level by level. Consumes shapes. GEOM_EMPTY -> nothing left. */
GeometryError tree_unite(GeometryEngine &eng, std::vector<Shape> &shapes, Shape &out);

/* Union of round capsules of the given radius along all contours of in. This is the Minkowski sum of the contours
 * with a polygonized circle, used where the engine cannot offset. */
GeometryError circle_buffer(GeometryEngine &eng, const Shape &in, double radius, int segments, Shape &out);

/* Grow (distance > 0) or shrink (distance < 0) the area of in. Uses the engine's offset where available, and the
 * circle buffer with round joins otherwise. */
GeometryError expand_shape(GeometryEngine &eng, const Shape &in, double distance, JoinStyle join, int segments,
        Shape &out, double miter_limit=4.0);

/* Area painted by stroking all contours of in. Without engine offsets, joins and caps degrade to round. */
GeometryError stroke_outline(GeometryEngine &eng, const Shape &in, const StrokeStyle &stroke, int segments,
        Shape &out);

} /* namespace badgecut */
