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
#include "svg_shapes.h"

namespace badgecut {

/* Painted areas of one primitive in its local coordinates. fill is painted first, ring on top of it. */
class StrokeParts {
public:
    Shape fill;
    Shape ring;
    bool has_fill = false;
    bool has_ring = false;
};

GeometryError decompose_stroke(GeometryEngine &eng, const Primitive &prim, const CompositeSettings &settings,
        StrokeParts &out);

/* Shapes covering everything prim paints, including the area enclosed by closed strokes, in the coordinates prim.mat
 * maps to. Appended to out. */
GeometryError silhouette_parts(GeometryEngine &eng, const Primitive &prim, const CompositeSettings &settings,
        std::vector<Shape> &out);

} /* namespace badgecut */
