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

#include <map>
#include <iostream>
#include <string>
#include <vector>
#include <array>
#include <utility>

#include <pugixml.hpp>

#include "geom2d.hpp"

namespace badgecut {

    constexpr char lib_version[] = "1.0";

    enum FillRule {
        FILL_NONZERO = 0,
        FILL_EVENODD,
    };

    enum JoinStyle {
        JOIN_MITER = 0,
        JOIN_ROUND,
        JOIN_BEVEL,
    };

    enum CapStyle {
        CAP_BUTT = 0,
        CAP_ROUND,
        CAP_SQUARE,
    };

    /* Outcome of a geometry engine operation. Anything but GEOM_OK leaves the output argument in an unspecified but
     * valid state. */
    enum GeometryError {
        GEOM_OK = 0,
        GEOM_EMPTY,
        GEOM_DEGENERATE,
        GEOM_OUT_OF_RANGE,
        GEOM_UNSUPPORTED,
        GEOM_ENGINE_FAILURE,
    };

    const char *geometry_error_str(GeometryError err);

    class StrokeStyle {
    public:
        double width = 0.0;
        JoinStyle join = JOIN_MITER;
        CapStyle cap = CAP_BUTT;
        double miter_limit = 4.0;
    };

    /* A set of contours in some user coordinate system. Closed contours bound an area according to fill_rule. Open
     * contours only ever contribute to strokes, boolean operations ignore them. */
    class Shape {
    public:
        Shape() {}
        Shape(FillRule rule) : fill_rule(rule) {}

        std::vector<Polygon> closed;
        std::vector<Polygon> open;
        FillRule fill_rule = FILL_NONZERO;

        bool empty() const { return closed.empty() && open.empty(); }
        bool is_compound() const { return closed.size() > 1; }
        bool finite() const;
        /* false -> empty shape, min/max untouched */
        bool bounds(d2p &min, d2p &max) const;
        /* Net enclosed area. Only meaningful for engine output, i.e. non-overlapping contours with holes wound
         * opposite to their outer contour. */
        double area() const;
        void transform(const xform2d &mat);
        void append(const Shape &other);
        std::string path_data(int digits=3) const;
    };

    /* Boolean geometry capability. Implementations must not throw. */
    class GeometryEngine {
    public:
        virtual ~GeometryEngine() {}
        virtual const char *name() const = 0;

        /* true -> offset() and offset_stroke() are available. Otherwise callers use the circle buffer
         * approximation from geom_approx. */
        virtual bool can_offset() const { return false; }

        virtual GeometryError unite(const Shape &a, const Shape &b, Shape &out) = 0;
        virtual GeometryError subtract(const Shape &a, const Shape &b, Shape &out) = 0;

        /* miter_limit applies to JOIN_MITER, as a ratio of the miter length to the offset distance */
        virtual GeometryError offset(const Shape &in, double distance, JoinStyle join, double miter_limit,
                Shape &out) {
            (void) in, (void) distance, (void) join, (void) miter_limit, (void) out;
            return GEOM_UNSUPPORTED;
        }

        virtual GeometryError offset_stroke(const Shape &in, const StrokeStyle &stroke, Shape &out) {
            (void) in, (void) stroke, (void) out;
            return GEOM_UNSUPPORTED;
        }

        /* Resolve self-intersections and overlaps of the closed contours of in. */
        GeometryError normalize(const Shape &in, Shape &out) {
            return unite(in, Shape(), out);
        }
    };

    class ClipperGeometry : public GeometryEngine {
    public:
        ClipperGeometry(bool exact_offset=true, double arc_tolerance=0.005)
            : m_exact_offset(exact_offset), m_arc_tolerance(arc_tolerance) {}
        virtual ~ClipperGeometry() {}

        virtual const char *name() const { return m_exact_offset ? "clipper" : "clipper-approx"; }
        virtual bool can_offset() const { return m_exact_offset; }

        virtual GeometryError unite(const Shape &a, const Shape &b, Shape &out);
        virtual GeometryError subtract(const Shape &a, const Shape &b, Shape &out);
        virtual GeometryError offset(const Shape &in, double distance, JoinStyle join, double miter_limit,
                Shape &out);
        virtual GeometryError offset_stroke(const Shape &in, const StrokeStyle &stroke, Shape &out);

    private:
        bool m_exact_offset;
        double m_arc_tolerance;
    };

    /* Returns nullptr for unknown names and for "none". */
    GeometryEngine *makeGeometryEngine(const std::string &name);

    class CompositeSettings {
    public:
        double curve_tolerance = 0.01;
        int precision = 3;
        std::string clip_id_prefix = "nc";
        int circle_segments = 32;
        bool verbose = false;
    };

    class BadgeDescriptor {
    public:
        std::string svg;
        double x_offset = 0.0;
        double y_offset = 0.0;
        double scale = 1.0;
        double gap = 0.5;
        std::string anchor = "br";
        int z_order = 0;
    };

    /* Fractional anchor position, (0, 0) is top left and (1, 1) is bottom right. */
    class Anchor {
    public:
        double ax = 1.0;
        double ay = 1.0;
    };

    /* true -> name was recognized */
    bool parse_anchor(const std::string &name, Anchor &out);
    extern const std::vector<std::string> anchor_names;

    class BadgePlacement {
    public:
        double tx = 0.0;
        double ty = 0.0;
        double scale = 1.0;
        std::string inner;
        double min_x = 0.0;
        double min_y = 0.0;
        double badge_w = 16.0;
        double badge_h = 16.0;
        /* Paint attributes on the badge's root element, inherited by its content */
        std::vector<std::pair<std::string, std::string>> root_paint;

        xform2d mat() const;
        std::string transform_str(int digits=3) const;
    };

    BadgePlacement compute_badge_placement(const std::string &badge_svg, double viewbox_size,
            double x_off, double y_off, double user_scale, const Anchor &anchor=Anchor(), d2p origin={0, 0});

    /* Build the notch for one badge: union of all visible badge primitives, placed on the canvas and expanded by
     * gap. GEOM_EMPTY -> the badge has nothing visible. */
    GeometryError build_notch(GeometryEngine &eng, const std::string &badge_svg, const BadgePlacement &placement,
            double gap, const CompositeSettings &settings, Shape &out);

    class FallbackEvent {
    public:
        int badge;
        std::string element;
        std::string id;
        GeometryError error;
    };

    class CompositeStats {
    public:
        int badges_applied = 0;
        int badges_skipped = 0;
        int primitives_cut = 0;
        int primitives_untouched = 0;
        int primitives_skipped = 0;
        int layers_clipped = 0;
        std::vector<FallbackEvent> fallbacks;
    };

    class BadgeCompositor {
    public:
        BadgeCompositor(const CompositeSettings &settings) : m_settings(settings) {}
        virtual ~BadgeCompositor() {}

        /* Composite all badges onto the given icon markup. Never fails: badges that cannot be applied are skipped
         * and the icon is returned as far as it could be processed. */
        virtual std::string apply(const std::string &svg, const std::vector<BadgeDescriptor> &badges) = 0;
        const CompositeStats &stats() const { return m_stats; }

    protected:
        std::vector<size_t> paint_order(const std::vector<BadgeDescriptor> &badges) const;

        const CompositeSettings &m_settings;
        CompositeStats m_stats;
    };

    /* Full engine: boolean cuts on the parsed document tree. */
    class GeometricCompositor : public BadgeCompositor {
    public:
        GeometricCompositor(GeometryEngine &engine, const CompositeSettings &settings)
            : BadgeCompositor(settings), m_engine(engine) {}
        virtual std::string apply(const std::string &svg, const std::vector<BadgeDescriptor> &badges);

    private:
        GeometryEngine &m_engine;
    };

    /* Dependency-free engine: rectangular clip regions inserted by plain string substitution. */
    class ClipRectCompositor : public BadgeCompositor {
    public:
        ClipRectCompositor(const CompositeSettings &settings) : BadgeCompositor(settings) {}
        virtual std::string apply(const std::string &svg, const std::vector<BadgeDescriptor> &badges);
    };

    /* Select the compositor for a run. engine == nullptr selects the clip rect fallback. The engine must outlive the
     * returned compositor. */
    BadgeCompositor *makeCompositor(GeometryEngine *engine, const CompositeSettings &settings);
}
