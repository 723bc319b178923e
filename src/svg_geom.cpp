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

#include "svg_geom.h"

#include <cmath>
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>

using namespace badgecut;
using namespace std;

const char *badgecut::geometry_error_str(GeometryError err) {
    switch (err) {
        case GEOM_OK: return "ok";
        case GEOM_EMPTY: return "empty geometry";
        case GEOM_DEGENERATE: return "degenerate geometry";
        case GEOM_OUT_OF_RANGE: return "coordinates out of range";
        case GEOM_UNSUPPORTED: return "operation not supported by geometry engine";
        case GEOM_ENGINE_FAILURE: return "geometry engine failure";
    }
    return "unknown error";
}

/* Fixed-point formatting with trailing zeros stripped, e.g. 1.500 -> "1.5", -0.0001 @ 3 digits -> "0" */
string badgecut::format_number(double value, int digits) {
    ostringstream os;
    os << fixed << setprecision(digits) << value;
    string s = os.str();

    if (s.find('.') != string::npos) {
        size_t last = s.find_last_not_of('0');
        s.erase(last + 1);
        if (s.back() == '.')
            s.pop_back();
    }

    if (s == "-0")
        s = "0";
    return s;
}

/* Number of decimal places needed in some element's local coordinates to keep the given number of decimal places on
 * the canvas. */
int badgecut::local_precision(xform2d mat, int digits) {
    double f = mat.doc2phys_max(1.0);
    if (!(f > 0.0) || !isfinite(f))
        return digits;

    int extra = (int)ceil(log10(f));
    return std::clamp(digits + extra, digits, 9);
}

bool badgecut::bounds_overlap(const d2p &a_min, const d2p &a_max, const d2p &b_min, const d2p &b_max, double margin) {
    return a_min[0] - margin <= b_max[0] && b_min[0] <= a_max[0] + margin
        && a_min[1] - margin <= b_max[1] && b_min[1] <= a_max[1] + margin;
}

enum FillRule badgecut::svg_fill_rule(const string &val) {
    if (val == "evenodd")
        return FILL_EVENODD;
    else
        return FILL_NONZERO; /* default */
}

enum JoinStyle badgecut::svg_join_style(const string &val) {
    if (val == "round")
        return JOIN_ROUND;

    if (val == "bevel")
        return JOIN_BEVEL;

    return JOIN_MITER;
}

enum CapStyle badgecut::svg_cap_style(const string &val) {
    if (val == "round")
        return CAP_ROUND;

    if (val == "square")
        return CAP_SQUARE;

    return CAP_BUTT;
}

void badgecut::rect_polygon(double x, double y, double w, double h, Polygon &out) {
    out = {
        {x,     y},
        {x + w, y},
        {x + w, y + h},
        {x,     y + h}
    };
}

/* Shoelace formula. Sign depends on winding direction. */
double badgecut::polygon_area(const Polygon &poly) {
    if (poly.size() < 3)
        return 0.0;

    double acc = 0.0;
    for (size_t i=0; i<poly.size(); i++) {
        const d2p &p = poly[i];
        const d2p &q = poly[(i+1) % poly.size()];
        acc += p[0]*q[1] - q[0]*p[1];
    }
    return acc / 2.0;
}

double badgecut::polygon_length(const Polygon &poly, bool closed) {
    double len = 0.0;
    for (size_t i=1; i<poly.size(); i++) {
        len += hypot(poly[i][0] - poly[i-1][0], poly[i][1] - poly[i-1][1]);
    }
    if (closed && poly.size() > 2) {
        len += hypot(poly.front()[0] - poly.back()[0], poly.front()[1] - poly.back()[1]);
    }
    return len;
}

bool badgecut::Shape::finite() const {
    for (const auto *set : {&closed, &open}) {
        for (const auto &poly : *set) {
            for (const auto &p : poly) {
                if (!isfinite(p[0]) || !isfinite(p[1]))
                    return false;
            }
        }
    }
    return true;
}

bool badgecut::Shape::bounds(d2p &min, d2p &max) const {
    bool found = false;
    d2p lo {0, 0}, hi {0, 0};

    for (const auto *set : {&closed, &open}) {
        for (const auto &poly : *set) {
            for (const auto &p : poly) {
                if (!found) {
                    lo = hi = p;
                    found = true;
                    continue;
                }
                lo[0] = fmin(lo[0], p[0]);
                lo[1] = fmin(lo[1], p[1]);
                hi[0] = fmax(hi[0], p[0]);
                hi[1] = fmax(hi[1], p[1]);
            }
        }
    }

    if (found) {
        min = lo;
        max = hi;
    }
    return found;
}

double badgecut::Shape::area() const {
    double acc = 0.0;
    for (const auto &poly : closed) {
        acc += polygon_area(poly);
    }
    return fabs(acc);
}

void badgecut::Shape::transform(const xform2d &mat) {
    for (auto &poly : closed)
        mat.transform_polygon(poly);
    for (auto &poly : open)
        mat.transform_polygon(poly);
}

void badgecut::Shape::append(const Shape &other) {
    closed.insert(closed.end(), other.closed.begin(), other.closed.end());
    open.insert(open.end(), other.open.begin(), other.open.end());
}

string badgecut::Shape::path_data(int digits) const {
    ostringstream os;
    bool first = true;

    auto emit = [&](const Polygon &poly, bool close) {
        if (poly.empty())
            return;

        if (!first)
            os << " ";
        first = false;

        os << "M" << format_number(poly[0][0], digits) << " " << format_number(poly[0][1], digits);
        for (size_t i=1; i<poly.size(); i++) {
            os << "L" << format_number(poly[i][0], digits) << " " << format_number(poly[i][1], digits);
        }
        if (close)
            os << "Z";
    };

    for (const auto &poly : closed)
        emit(poly, true);
    for (const auto &poly : open)
        emit(poly, false);

    return os.str();
}
