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

#include <pugixml.hpp>
#include <badgecut.hpp>
#include "geom_approx.h"
#include "stroke.h"
#include "svg_shapes.h"
#include "svg_color.h"

using namespace badgecut;
using namespace std;

namespace {

class SilhouetteWalker {
public:
    SilhouetteWalker(GeometryEngine &eng, const CompositeSettings &settings, double tolerance)
        : m_eng(eng), m_settings(settings), m_tolerance(tolerance) {}

    /* Recursively collect the painted areas of all visible leaves below group */
    void walk(const pugi::xml_node &group, const xform2d &mat, const PaintStyle &style) {
        for (const auto &node : group.children()) {
            if (node.type() != pugi::node_element)
                continue;

            if (svg_non_rendering(node) || svg_display_none(node))
                continue;

            ElementKind kind = element_kind(node);
            if (kind == ELEM_GROUP) {
                xform2d child_mat(mat);
                child_mat.transform(xform2d(node.attribute("transform").value()));
                walk(node, child_mat, style.inherit(node));
                continue;
            }

            if (kind == ELEM_UNKNOWN) {
                cerr << "Warning: Ignoring unsupported badge element <" << node.name() << ">" << endl;
                continue;
            }

            Primitive prim;
            if (!import_primitive(node, mat, style, m_tolerance, prim) || !prim.painted())
                continue;

            GeometryError err = silhouette_parts(m_eng, prim, m_settings, m_parts);
            if (err != GEOM_OK) {
                cerr << "Warning: Skipping badge <" << node.name() << "> \"" << node.attribute("id").value()
                    << "\" in silhouette: " << geometry_error_str(err) << endl;
            }
        }
    }

    vector<Shape> &parts() { return m_parts; }

private:
    GeometryEngine &m_eng;
    const CompositeSettings &m_settings;
    double m_tolerance;
    vector<Shape> m_parts;
};

} /* anonymous namespace */

GeometryError badgecut::build_notch(GeometryEngine &eng, const string &badge_svg, const BadgePlacement &placement,
        double gap, const CompositeSettings &settings, Shape &out) {
    if (!(placement.scale > 0.0) || !isfinite(placement.scale))
        return GEOM_DEGENERATE;

    pugi::xml_document doc;
    auto res = doc.load_string(badge_svg.c_str());
    if (!res) {
        cerr << "Warning: Cannot parse badge markup: " << res.description() << endl;
        return GEOM_DEGENERATE;
    }

    pugi::xml_node root = doc.child("svg");
    if (!root) {
        cerr << "Warning: Badge markup is missing root <svg> element" << endl;
        return GEOM_DEGENERATE;
    }

    /* Flatten curves in badge units so the error stays within tolerance on the canvas */
    SilhouetteWalker walker(eng, settings, settings.curve_tolerance / placement.scale);
    walker.walk(root, xform2d(), PaintStyle().inherit(root));

    size_t num_parts = walker.parts().size();
    Shape united;
    GeometryError err = tree_unite(eng, walker.parts(), united);
    if (err != GEOM_OK)
        return err;

    united.transform(placement.mat());

    if (gap != 0.0) {
        err = expand_shape(eng, united, gap, JOIN_ROUND, settings.circle_segments, out);
        if (err != GEOM_OK)
            return err;
    } else {
        out = std::move(united);
    }

    if (settings.verbose) {
        cerr << "Info: Badge silhouette united from " << num_parts << " parts into " << out.closed.size()
            << " contours" << endl;
    }

    return out.closed.empty() ? GEOM_EMPTY : GEOM_OK;
}
