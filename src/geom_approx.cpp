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
#include <numbers>
#include <algorithm>

#include "geom_approx.h"
#include "svg_geom.h"

using namespace badgecut;
using namespace std;

GeometryError badgecut::tree_unite(GeometryEngine &eng, vector<Shape> &shapes, Shape &out) {
    if (shapes.empty())
        return GEOM_EMPTY;

    if (shapes.size() == 1) {
        GeometryError err = eng.normalize(shapes[0], out);
        shapes.clear();
        if (err != GEOM_OK)
            return err;
        return out.closed.empty() ? GEOM_EMPTY : GEOM_OK;
    }

    while (shapes.size() > 1) {
        vector<Shape> level;
        level.reserve((shapes.size() + 1) / 2);

        for (size_t i=0; i+1<shapes.size(); i+=2) {
            Shape merged;
            GeometryError err = eng.unite(shapes[i], shapes[i+1], merged);
            if (err != GEOM_OK) {
                shapes.clear();
                return err;
            }
            level.push_back(std::move(merged));
        }

        if (shapes.size() % 2)
            level.push_back(std::move(shapes.back()));

        /* previous level is released here */
        shapes = std::move(level);
    }

    out = std::move(shapes[0]);
    shapes.clear();
    return out.closed.empty() ? GEOM_EMPTY : GEOM_OK;
}

static void add_positive(Shape &shape, Polygon &&poly) {
    if (polygon_area(poly) < 0.0)
        std::reverse(poly.begin(), poly.end());
    shape.closed.push_back(std::move(poly));
}

static void buffer_contour(Shape &buf, const Polygon &contour, bool closed, double radius, int segments) {
    size_t n = contour.size();
    size_t n_seg = closed ? n : n - 1;

    for (size_t i=0; i<n; i++) {
        Polygon circle;
        circle.reserve(segments);
        for (int j=0; j<segments; j++) {
            double t = 2*std::numbers::pi * j / segments;
            circle.push_back({contour[i][0] + radius*cos(t), contour[i][1] + radius*sin(t)});
        }
        add_positive(buf, std::move(circle));
    }

    for (size_t i=0; i<n_seg; i++) {
        const d2p &a = contour[i];
        const d2p &b = contour[(i+1) % n];
        double dx = b[0] - a[0], dy = b[1] - a[1];
        double len = hypot(dx, dy);
        if (len == 0.0)
            continue;

        double nx = -dy / len * radius, ny = dx / len * radius;
        add_positive(buf, Polygon {
                {a[0] + nx, a[1] + ny},
                {b[0] + nx, b[1] + ny},
                {b[0] - nx, b[1] - ny},
                {a[0] - nx, a[1] - ny}
            });
    }
}

GeometryError badgecut::circle_buffer(GeometryEngine &eng, const Shape &in, double radius, int segments, Shape &out) {
    if (!isfinite(radius) || !in.finite())
        return GEOM_DEGENERATE;

    segments = std::max(segments, 8);
    radius = fabs(radius);

    /* All pieces are wound the same way, so a single nonzero normalization unites them */
    Shape buf(FILL_NONZERO);
    for (const auto &poly : in.closed) {
        if (!poly.empty())
            buffer_contour(buf, poly, true, radius, segments);
    }
    for (const auto &poly : in.open) {
        if (!poly.empty())
            buffer_contour(buf, poly, false, radius, segments);
    }

    if (buf.closed.empty()) {
        out = Shape(FILL_NONZERO);
        return GEOM_EMPTY;
    }
    return eng.normalize(buf, out);
}

GeometryError badgecut::expand_shape(GeometryEngine &eng, const Shape &in, double distance, JoinStyle join,
        int segments, Shape &out, double miter_limit) {
    if (distance == 0.0)
        return eng.normalize(in, out);

    if (eng.can_offset())
        return eng.offset(in, distance, join, miter_limit, out);

    Shape closed_only(in.fill_rule);
    closed_only.closed = in.closed;

    Shape buf;
    GeometryError err = circle_buffer(eng, closed_only, distance, segments, buf);
    if (err == GEOM_EMPTY)
        return eng.normalize(in, out);
    if (err != GEOM_OK)
        return err;

    if (distance > 0.0)
        return eng.unite(in, buf, out);
    return eng.subtract(in, buf, out);
}

GeometryError badgecut::stroke_outline(GeometryEngine &eng, const Shape &in, const StrokeStyle &stroke, int segments,
        Shape &out) {
    if (eng.can_offset())
        return eng.offset_stroke(in, stroke, out);

    if (!(stroke.width > 0.0)) {
        out = Shape(FILL_NONZERO);
        return isfinite(stroke.width) ? GEOM_OK : GEOM_DEGENERATE;
    }

    GeometryError err = circle_buffer(eng, in, stroke.width / 2, segments, out);
    if (err == GEOM_EMPTY) {
        out = Shape(FILL_NONZERO);
        return GEOM_OK;
    }
    return err;
}
