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

#include <clipper.hpp>
#include <badgecut.hpp>
#include "svg_geom.h"

using namespace badgecut;
using namespace std;
using namespace ClipperLib;

namespace {

/* Fixed point scale for clipper's integer coordinates */
constexpr double clipper_scale = 1e7;
/* Leave some headroom below clipper's hiRange so intermediate offsets cannot overflow */
constexpr double clipper_max_coord = 1e15;

GeometryError to_clipper(const vector<Polygon> &polys, Paths &out) {
    out.clear();
    for (const auto &poly : polys) {
        Path path;
        path.reserve(poly.size());
        for (const auto &p : poly) {
            if (!isfinite(p[0]) || !isfinite(p[1]))
                return GEOM_DEGENERATE;

            double x = round(p[0] * clipper_scale);
            double y = round(p[1] * clipper_scale);
            if (fabs(x) > clipper_max_coord || fabs(y) > clipper_max_coord)
                return GEOM_OUT_OF_RANGE;

            path.push_back(IntPoint((cInt)x, (cInt)y));
        }
        out.push_back(path);
    }
    return GEOM_OK;
}

void from_clipper(Paths &paths, Shape &out) {
    CleanPolygons(paths);
    out = Shape(FILL_NONZERO);
    for (const auto &path : paths) {
        if (path.size() < 3)
            continue;

        Polygon poly;
        poly.reserve(path.size());
        for (const auto &p : path) {
            poly.push_back({ ((double)p.X) / clipper_scale, ((double)p.Y) / clipper_scale });
        }
        out.closed.push_back(poly);
    }
}

PolyFillType clipper_fill_rule(FillRule rule) {
    return rule == FILL_EVENODD ? pftEvenOdd : pftNonZero;
}

JoinType clipper_join_type(JoinStyle join) {
    switch (join) {
        case JOIN_ROUND:
            return jtRound;
        case JOIN_BEVEL:
            /* Clipper has no true bevel. Its square join cuts the corner at the offset distance, which covers
             * slightly more than an SVG bevel join. */
            return jtSquare;
        default:
            return jtMiter;
    }
}

EndType clipper_end_type(CapStyle cap) {
    switch (cap) {
        case CAP_ROUND:
            return etOpenRound;
        case CAP_SQUARE:
            return etOpenSquare;
        default:
            return etOpenButt;
    }
}

GeometryError boolean_op(ClipType op, const Shape &a, const Shape &b, Shape &out) {
    Paths subject, clip;
    GeometryError err = to_clipper(a.closed, subject);
    if (err != GEOM_OK)
        return err;
    err = to_clipper(b.closed, clip);
    if (err != GEOM_OK)
        return err;

    try {
        Clipper c;
        c.StrictlySimple(true);
        /* AddPaths only rejects paths with less than three distinct points, which do not enclose anything anyway. */
        c.AddPaths(subject, ptSubject, /* closed */ true);
        c.AddPaths(clip, ptClip, /* closed */ true);

        PolyTree ptree;
        if (!c.Execute(op, ptree, clipper_fill_rule(a.fill_rule), clipper_fill_rule(b.fill_rule)))
            return GEOM_ENGINE_FAILURE;

        Paths result;
        PolyTreeToPaths(ptree, result);
        from_clipper(result, out);

    } catch (clipperException &e) {
        cerr << "Warning: Clipper error: " << e.what() << endl;
        return GEOM_ENGINE_FAILURE;
    }

    return GEOM_OK;
}

} /* anonymous namespace */

GeometryError badgecut::ClipperGeometry::unite(const Shape &a, const Shape &b, Shape &out) {
    return boolean_op(ctUnion, a, b, out);
}

GeometryError badgecut::ClipperGeometry::subtract(const Shape &a, const Shape &b, Shape &out) {
    return boolean_op(ctDifference, a, b, out);
}

GeometryError badgecut::ClipperGeometry::offset(const Shape &in, double distance, JoinStyle join,
        double miter_limit, Shape &out) {
    if (!m_exact_offset)
        return GEOM_UNSUPPORTED;

    if (!isfinite(distance))
        return GEOM_DEGENERATE;

    /* ClipperOffset expects a shape without self-intersections, with hole orientation indicating holes. */
    Shape normalized;
    GeometryError err = normalize(in, normalized);
    if (err != GEOM_OK)
        return err;

    Paths paths;
    err = to_clipper(normalized.closed, paths);
    if (err != GEOM_OK)
        return err;

    try {
        ClipperOffset co(miter_limit, m_arc_tolerance * clipper_scale);
        co.AddPaths(paths, clipper_join_type(join), etClosedPolygon);

        Paths result;
        co.Execute(result, distance * clipper_scale);
        from_clipper(result, out);

    } catch (clipperException &e) {
        cerr << "Warning: Clipper error: " << e.what() << endl;
        return GEOM_ENGINE_FAILURE;
    }

    return GEOM_OK;
}

GeometryError badgecut::ClipperGeometry::offset_stroke(const Shape &in, const StrokeStyle &stroke, Shape &out) {
    if (!m_exact_offset)
        return GEOM_UNSUPPORTED;

    if (!isfinite(stroke.width) || !isfinite(stroke.miter_limit))
        return GEOM_DEGENERATE;

    if (stroke.width <= 0.0) {
        out = Shape(FILL_NONZERO);
        return GEOM_OK;
    }

    Paths closed, open;
    GeometryError err = to_clipper(in.closed, closed);
    if (err != GEOM_OK)
        return err;
    err = to_clipper(in.open, open);
    if (err != GEOM_OK)
        return err;

    try {
        ClipperOffset co(stroke.miter_limit, m_arc_tolerance * clipper_scale);
        JoinType join = clipper_join_type(stroke.join);
        co.AddPaths(closed, join, etClosedLine);
        co.AddPaths(open, join, clipper_end_type(stroke.cap));

        PolyTree ptree;
        co.Execute(ptree, 0.5 * stroke.width * clipper_scale);

        Paths result;
        PolyTreeToPaths(ptree, result);
        from_clipper(result, out);

    } catch (clipperException &e) {
        cerr << "Warning: Clipper error: " << e.what() << endl;
        return GEOM_ENGINE_FAILURE;
    }

    return GEOM_OK;
}

GeometryEngine *badgecut::makeGeometryEngine(const string &name) {
    if (name == "clipper") {
        return new ClipperGeometry(/* exact offset */ true);
    } else if (name == "clipper-approx") {
        return new ClipperGeometry(/* exact offset */ false);
    }
    return nullptr;
}
