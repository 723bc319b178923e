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

#include <flatten.hpp>
#include <cmath>

using namespace badgecut;

namespace badgecut {
    constexpr unsigned curve_recursion_limit = 16;
}

static inline d2p midpoint(const d2p &a, const d2p &b) {
    return d2p{(a[0] + b[0]) / 2, (a[1] + b[1]) / 2};
}

/* Distance of p from the line through a and b, or from a if a and b coincide */
static double line_distance(const d2p &p, const d2p &a, const d2p &b) {
    double dx = b[0] - a[0];
    double dy = b[1] - a[1];
    double len = hypot(dx, dy);
    if (len < 1e-12) {
        return hypot(p[0] - a[0], p[1] - a[1]);
    }
    return fabs((p[0] - a[0]) * dy - (p[1] - a[1]) * dx) / len;
}

void curve4_div::run(d2p p1, d2p p2, d2p p3, d2p p4) {
    m_points.clear();
    recursive_bezier(p1, p2, p3, p4, 0);
}

void curve4_div::recursive_bezier(d2p p1, d2p p2, d2p p3, d2p p4, unsigned level) {
    double flatness = fmax(line_distance(p2, p1, p4), line_distance(p3, p1, p4));
    if (flatness <= m_distance_tolerance || level >= curve_recursion_limit) {
        m_points.push_back(p4);
        return;
    }

    /* de Casteljau split at t=0.5 */
    d2p p12 = midpoint(p1, p2);
    d2p p23 = midpoint(p2, p3);
    d2p p34 = midpoint(p3, p4);
    d2p p123 = midpoint(p12, p23);
    d2p p234 = midpoint(p23, p34);
    d2p p1234 = midpoint(p123, p234);

    recursive_bezier(p1, p12, p123, p1234, level + 1);
    recursive_bezier(p1234, p234, p34, p4, level + 1);
}
