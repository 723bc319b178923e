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
#include "geom2d.hpp"

namespace badgecut {
    /* Adaptive subdivision of a cubic bezier into line segments. */
    class curve4_div {
        public:
            curve4_div(double distance_tolerance=0.1) : m_distance_tolerance(fmax(distance_tolerance, 1e-9)) {}

            /* Flatten the curve from p1 to p4. points() afterwards contains the flattened curve without its start
             * point p1, ending exactly in p4. */
            void run(d2p p1, d2p p2, d2p p3, d2p p4);
            const std::vector<d2p> &points() { return m_points; }

        private:
            void recursive_bezier(d2p p1, d2p p2, d2p p3, d2p p4, unsigned level);
            double m_distance_tolerance;
            std::vector<d2p> m_points;
    };
}
