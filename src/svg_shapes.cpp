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

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>
#include <numbers>

#include "svg_shapes.h"
#include "svg_geom.h"
#include "svg_path.h"
#include "svg_import_util.h"

using namespace badgecut;
using namespace std;

ElementKind badgecut::element_kind(const pugi::xml_node &node) {
    string name(node.name());

    if (name == "circle") {
        return ELEM_CIRCLE;
    } else if (name == "rect") {
        return ELEM_RECT;
    } else if (name == "ellipse") {
        return ELEM_ELLIPSE;
    } else if (name == "polygon") {
        return ELEM_POLYGON;
    } else if (name == "polyline") {
        return ELEM_POLYLINE;
    } else if (name == "line") {
        return ELEM_LINE;
    } else if (name == "path") {
        if (count_subpaths(node.attribute("d").value()) > 1)
            return ELEM_COMPOUND_PATH;
        return ELEM_SIMPLE_PATH;
    } else if (name == "g" || name == "a") {
        return ELEM_GROUP;
    }
    return ELEM_UNKNOWN;
}

const char *badgecut::element_kind_str(ElementKind kind) {
    switch (kind) {
        case ELEM_CIRCLE: return "circle";
        case ELEM_RECT: return "rect";
        case ELEM_ELLIPSE: return "ellipse";
        case ELEM_POLYGON: return "polygon";
        case ELEM_POLYLINE: return "polyline";
        case ELEM_LINE: return "line";
        case ELEM_SIMPLE_PATH: return "simple path";
        case ELEM_COMPOUND_PATH: return "compound path";
        case ELEM_GROUP: return "group";
        default: return "unknown";
    }
}

bool badgecut::svg_non_rendering(const pugi::xml_node &node) {
    static const char *names[] = {
        "defs", "clipPath", "mask", "symbol", "pattern", "marker", "linearGradient", "radialGradient", "filter",
        "style", "script", "title", "desc", "metadata",
    };

    for (const char *name : names) {
        if (!strcmp(node.name(), name))
            return true;
    }
    return false;
}

/* Number of segments for a full turn of radius r so that no chord deviates more than tolerance from the arc */
static int arc_segments(double r, double tolerance) {
    if (!(tolerance > 0.0) || !isfinite(tolerance))
        tolerance = 0.01;

    if (!(r > tolerance))
        return 8;

    int n = (int)ceil(std::numbers::pi / acos(1.0 - tolerance / r));
    n = (n + 3) / 4 * 4;
    return std::clamp(n, 8, 1024);
}

void badgecut::ellipse_contour(double cx, double cy, double rx, double ry, double tolerance, Polygon &out) {
    int n = arc_segments(fmax(rx, ry), tolerance);
    out.clear();
    out.reserve(n);
    for (int i=0; i<n; i++) {
        double t = 2*std::numbers::pi * i / n;
        out.push_back({cx + rx*cos(t), cy + ry*sin(t)});
    }
}

void badgecut::rect_contour(double x, double y, double w, double h, double rx, double ry, double tolerance,
        Polygon &out) {
    if (rx <= 0.0 || ry <= 0.0) {
        rect_polygon(x, y, w, h, out);
        return;
    }

    int quarter = arc_segments(fmax(rx, ry), tolerance) / 4;
    const d2p centers[4] = {
        {x + w - rx, y + ry},
        {x + w - rx, y + h - ry},
        {x + rx, y + h - ry},
        {x + rx, y + ry},
    };

    out.clear();
    for (int c=0; c<4; c++) {
        /* Corners in drawing order top right, bottom right, bottom left, top left */
        double start = (c - 1) * std::numbers::pi / 2;
        for (int i=0; i<=quarter; i++) {
            double t = start + (std::numbers::pi / 2) * i / quarter;
            out.push_back({centers[c][0] + rx*cos(t), centers[c][1] + ry*sin(t)});
        }
    }
}

static void point_list(const pugi::xml_node &node, Polygon &out) {
    vector<double> coords;
    parse_number_list(node.attribute("points").value(), coords);
    if (coords.size() % 2) {
        cerr << "Warning: Odd number of coordinates in points of <" << node.name() << "> \""
            << node.attribute("id").value() << "\", ignoring last one" << endl;
    }

    for (size_t i=0; i+1<coords.size(); i+=2) {
        out.push_back({coords[i], coords[i+1]});
    }
}

bool badgecut::import_primitive(const pugi::xml_node &node, const xform2d &parent_mat,
        const PaintStyle &parent_style, double tolerance, Primitive &out) {
    ElementKind kind = element_kind(node);
    if (kind == ELEM_UNKNOWN || kind == ELEM_GROUP)
        return false;

    out = Primitive();
    out.kind = kind;
    out.node = node;
    out.mat = parent_mat;
    out.mat.transform(xform2d(node.attribute("transform").value()));
    out.style = parent_style.inherit(node);
    out.shape.fill_rule = out.style.fill_rule;

    /* Flatten curves in local units such that the error is within tolerance after transformation */
    xform2d local(out.mat);
    double local_tol = local.phys2doc_min(tolerance);

    switch (kind) {
        case ELEM_CIRCLE: {
            out.cx = svg_double_attr(node, "cx");
            out.cy = svg_double_attr(node, "cy");
            out.r = svg_double_attr(node, "r");
            if (out.r > 0.0 || isnan(out.r)) {
                Polygon poly;
                ellipse_contour(out.cx, out.cy, out.r, out.r, local_tol, poly);
                out.shape.closed.push_back(poly);
            }
            break;
        }

        case ELEM_ELLIPSE: {
            double ex = svg_double_attr(node, "cx");
            double ey = svg_double_attr(node, "cy");
            double erx = svg_double_attr(node, "rx", NAN);
            double ery = svg_double_attr(node, "ry", NAN);
            /* auto */
            if (!node.attribute("rx"))
                erx = ery;
            if (!node.attribute("ry"))
                ery = erx;

            if ((erx > 0.0 && ery > 0.0) || isnan(erx) || isnan(ery)) {
                Polygon poly;
                ellipse_contour(ex, ey, erx, ery, local_tol, poly);
                out.shape.closed.push_back(poly);
            }
            break;
        }

        case ELEM_RECT: {
            out.x = svg_double_attr(node, "x");
            out.y = svg_double_attr(node, "y");
            out.width = svg_double_attr(node, "width");
            out.height = svg_double_attr(node, "height");
            bool has_rx = node.attribute("rx") && svg_double_attr(node, "rx") >= 0.0;
            bool has_ry = node.attribute("ry") && svg_double_attr(node, "ry") >= 0.0;
            out.rx = has_rx ? svg_double_attr(node, "rx") : 0.0;
            out.ry = has_ry ? svg_double_attr(node, "ry") : 0.0;
            if (has_rx && !has_ry)
                out.ry = out.rx;
            if (has_ry && !has_rx)
                out.rx = out.ry;
            out.rx = fmin(out.rx, out.width / 2);
            out.ry = fmin(out.ry, out.height / 2);

            if ((out.width > 0.0 && out.height > 0.0) || isnan(out.width) || isnan(out.height)) {
                Polygon poly;
                rect_contour(out.x, out.y, out.width, out.height, out.rx, out.ry, local_tol, poly);
                out.shape.closed.push_back(poly);
            }
            break;
        }

        case ELEM_POLYGON: {
            Polygon poly;
            point_list(node, poly);
            if (poly.size() >= 3) {
                out.shape.closed.push_back(poly);
            } else if (poly.size() == 2) {
                out.shape.open.push_back({poly[0], poly[1], poly[0]});
            }
            break;
        }

        case ELEM_POLYLINE: {
            Polygon poly;
            point_list(node, poly);
            if (poly.size() >= 2)
                out.shape.open.push_back(poly);
            break;
        }

        case ELEM_LINE: {
            d2p p1 {svg_double_attr(node, "x1"), svg_double_attr(node, "y1")};
            d2p p2 {svg_double_attr(node, "x2"), svg_double_attr(node, "y2")};
            out.shape.open.push_back({p1, p2});
            break;
        }

        case ELEM_SIMPLE_PATH:
        case ELEM_COMPOUND_PATH:
            if (!parse_path_data(node.attribute("d").value(), local_tol, out.shape)) {
                cerr << "Warning: Error in path data of <path> \"" << node.attribute("id").value()
                    << "\", rendering up to the error" << endl;
            }
            break;

        default:
            return false;
    }

    return true;
}
