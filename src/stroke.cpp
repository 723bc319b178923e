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
#include <iostream>

#include "stroke.h"
#include "geom_approx.h"
#include "svg_path.h"

using namespace badgecut;
using namespace std;

namespace {

double local_tolerance(const Primitive &prim, const CompositeSettings &settings) {
    xform2d mat(prim.mat);
    return mat.phys2doc_min(settings.curve_tolerance);
}

/* Outer and inner boundary of a solid circle or rect stroke, computed from the element's own geometry instead of
 * offsetting its polygonization. false -> not applicable. */
bool analytic_bounds(const Primitive &prim, double tolerance, Shape &outer, Shape &inner) {
    double hw = prim.style.stroke_width / 2;
    Polygon poly;

    if (prim.kind == ELEM_CIRCLE) {
        if (!(prim.r > 0.0))
            return false;

        ellipse_contour(prim.cx, prim.cy, prim.r + hw, prim.r + hw, tolerance, poly);
        outer.closed.push_back(poly);
        if (prim.r - hw > 0.0) {
            ellipse_contour(prim.cx, prim.cy, prim.r - hw, prim.r - hw, tolerance, poly);
            inner.closed.push_back(poly);
        }
        return true;

    } else if (prim.kind == ELEM_RECT) {
        if (!(prim.width > 0.0 && prim.height > 0.0))
            return false;

        /* Sharp outer corners are only right for mitered joins */
        bool rounded = prim.rx > 0.0 && prim.ry > 0.0;
        if (!rounded && !(prim.style.join == JOIN_MITER && prim.style.miter_limit >= sqrt(2.0)))
            return false;

        /* Corner radii grow and shrink with the offset like an exact offset of the rounded outline would */
        double rx_out = prim.rx > 0.0 ? prim.rx + hw : 0.0;
        double ry_out = prim.ry > 0.0 ? prim.ry + hw : 0.0;
        rect_contour(prim.x - hw, prim.y - hw, prim.width + 2*hw, prim.height + 2*hw, rx_out, ry_out, tolerance, poly);
        outer.closed.push_back(poly);

        double w_in = prim.width - 2*hw;
        double h_in = prim.height - 2*hw;
        if (w_in > 0.0 && h_in > 0.0) {
            double rx_in = fmin(fmax(0.0, prim.rx - hw), w_in / 2);
            double ry_in = fmin(fmax(0.0, prim.ry - hw), h_in / 2);
            rect_contour(prim.x + hw, prim.y + hw, w_in, h_in, rx_in, ry_in, tolerance, poly);
            inner.closed.push_back(poly);
        }
        return true;
    }

    return false;
}

/* Contours to stroke, with the dash pattern applied. Dashing turns closed contours into open pieces. */
void stroke_contours(const Primitive &prim, Shape &out) {
    const auto &dasharray = prim.style.dasharray;
    if (dasharray.empty()) {
        out.closed = prim.shape.closed;
        out.open = prim.shape.open;
        return;
    }

    for (const auto &poly : prim.shape.closed) {
        Polygon loop(poly);
        loop.push_back(poly.front());
        dash_path(loop, out.open, dasharray, prim.style.dash_offset);
    }

    for (const auto &poly : prim.shape.open) {
        dash_path(poly, out.open, dasharray, prim.style.dash_offset);
    }
}

} /* anonymous namespace */

GeometryError badgecut::decompose_stroke(GeometryEngine &eng, const Primitive &prim,
        const CompositeSettings &settings, StrokeParts &out) {
    out = StrokeParts();

    const PaintStyle &style = prim.style;
    /* Open contours never enclose a fill area */
    out.has_fill = style.has_fill() && !prim.shape.closed.empty();
    out.has_ring = style.has_stroke() && !prim.shape.empty();

    out.fill = Shape(prim.shape.fill_rule);
    if (out.has_fill)
        out.fill.closed = prim.shape.closed;

    if (!out.has_ring)
        return GEOM_OK;

    double tolerance = local_tolerance(prim, settings);
    if (!isfinite(tolerance))
        return GEOM_DEGENERATE;

    Shape outer, inner;
    if (style.dasharray.empty() && analytic_bounds(prim, tolerance, outer, inner)) {
        GeometryError err = eng.subtract(outer, inner, out.ring);
        if (err != GEOM_OK)
            return err;

        if (out.has_fill) {
            /* The inner half of the stroke covers the fill's edge, so only the inner boundary needs filling. */
            out.fill = inner;
            out.has_fill = !inner.closed.empty();
        }
        return GEOM_OK;
    }

    Shape contours;
    stroke_contours(prim, contours);
    if (contours.empty()) {
        out.has_ring = false;
        return GEOM_OK;
    }

    return stroke_outline(eng, contours, style.stroke_style(), settings.circle_segments, out.ring);
}

GeometryError badgecut::silhouette_parts(GeometryEngine &eng, const Primitive &prim,
        const CompositeSettings &settings, vector<Shape> &out) {
    const PaintStyle &style = prim.style;
    if (!prim.painted())
        return GEOM_OK;

    if (!prim.shape.finite())
        return GEOM_DEGENERATE;

    vector<Shape> parts;

    if (style.has_fill() && !prim.shape.closed.empty()) {
        Shape fill(prim.shape.fill_rule);
        fill.closed = prim.shape.closed;
        parts.push_back(fill);
    }

    if (style.has_stroke()) {
        double hw = style.stroke_width / 2;

        if (!prim.shape.closed.empty()) {
            /* Everything inside a closed stroke is off limits too, not just the ring itself */
            Shape closed(prim.shape.fill_rule);
            closed.closed = prim.shape.closed;

            Shape expanded;
            GeometryError err = expand_shape(eng, closed, hw, style.join, settings.circle_segments, expanded,
                    style.miter_limit);
            if (err != GEOM_OK)
                return err;
            parts.push_back(expanded);
        }

        if (!prim.shape.open.empty()) {
            Shape open;
            open.open = prim.shape.open;

            Shape outline;
            GeometryError err = stroke_outline(eng, open, style.stroke_style(), settings.circle_segments, outline);
            if (err != GEOM_OK)
                return err;
            parts.push_back(outline);
        }
    }

    for (auto &part : parts) {
        part.transform(prim.mat);
        out.push_back(std::move(part));
    }
    return GEOM_OK;
}
