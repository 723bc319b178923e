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

#include <string>
#include <pugixml.hpp>
#include <badgecut.hpp>
#include "svg_color.h"

namespace badgecut {

enum ElementKind {
    ELEM_UNKNOWN = 0,
    ELEM_CIRCLE,
    ELEM_RECT,
    ELEM_ELLIPSE,
    ELEM_POLYGON,
    ELEM_POLYLINE,
    ELEM_LINE,
    ELEM_SIMPLE_PATH,
    ELEM_COMPOUND_PATH,
    ELEM_GROUP,
};

ElementKind element_kind(const pugi::xml_node &node);
const char *element_kind_str(ElementKind kind);
/* Definitions and metadata that are never painted where they appear in the tree */
bool svg_non_rendering(const pugi::xml_node &node);

/* One imported shape element. shape is in the element's local coordinates, i.e. before its own transform attribute
 * is applied. mat maps these local coordinates to the root coordinate system. */
class Primitive {
public:
    ElementKind kind = ELEM_UNKNOWN;
    pugi::xml_node node;
    Shape shape;
    xform2d mat;
    PaintStyle style;

    /* Resolved geometry of circles and rects, used for analytic stroke rings */
    double cx = 0, cy = 0, r = 0;
    double x = 0, y = 0, width = 0, height = 0, rx = 0, ry = 0;

    bool painted() const { return style.visible && (style.has_fill() || style.has_stroke()); }
};

/* Import one leaf shape element. tolerance is the curve flattening tolerance in root coordinates. false -> node is
 * not a supported shape element (groups included). */
bool import_primitive(const pugi::xml_node &node, const xform2d &parent_mat, const PaintStyle &parent_style,
        double tolerance, Primitive &out);

void ellipse_contour(double cx, double cy, double rx, double ry, double tolerance, Polygon &out);
void rect_contour(double x, double y, double w, double h, double rx, double ry, double tolerance, Polygon &out);

} /* namespace badgecut */
