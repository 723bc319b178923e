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
#include <set>
#include <string>
#include <vector>

#include <pugixml.hpp>
#include <badgecut.hpp>
#include "svg_color.h"

namespace badgecut {

    /* Base icon markup parsed for in-place modification */
    class IconDocument {
    public:
        IconDocument() : _valid(false) {}

        /* true -> load successful */
        bool load(const std::string &svg);
        bool valid() const { return _valid; }
        operator bool() const { return valid(); }

        std::string serialize() const;

        pugi::xml_node root() { return root_elem; }
        /* The document's <defs>, created as first child of the root if missing */
        pugi::xml_node defs();
        /* base, or base with a numeric suffix if base is already taken. The result is reserved. */
        std::string unique_id(const std::string &base);

        double canvas_size() const { return vb_w; }
        d2p canvas_origin() const { return {vb_x, vb_y}; }
        void canvas_rect(Polygon &out) const;
        /* Make ids used below node unavailable to unique_id */
        void reserve_ids(const pugi::xml_node &node);

    private:

        bool _valid;
        pugi::xml_document svg_doc;
        pugi::xml_node root_elem;
        pugi::xml_node defs_node;
        double vb_x = 0, vb_y = 0, vb_w = 16, vb_h = 16;
        std::set<std::string> ids;
    };

    /* <clipPath> elements for one keep region. The region is given in root coordinates, elements with a different
     * user coordinate system get a variant carrying the inverse transform. Elements are added on first use. */
    class ClipRegistry {
    public:
        ClipRegistry(IconDocument &doc, const Shape &keep, const std::string &id, int precision)
            : m_doc(doc), m_keep(keep), m_id(id), m_precision(precision) {}

        /* url() reference for use on an element whose user space maps to root coordinates through mat */
        std::string ref(const xform2d &mat);

    private:
        pugi::xml_node add_clip(const std::string &id);

        IconDocument &m_doc;
        const Shape &m_keep;
        std::string m_id;
        int m_precision;
        bool m_added = false;
        std::map<std::string, std::string> m_variants;
    };

    /* Traversal state of the base icon tree */
    class CutContext {
    public:
        CutContext(const xform2d &mat, const PaintStyle &style) : m_mat(mat), m_style(style) {}
        CutContext(CutContext &parent, const pugi::xml_node &node)
            : m_mat(parent.m_mat), m_style(parent.m_style.inherit(node)) {
            m_mat.transform(xform2d(node.attribute("transform").value()));
        }

        xform2d &mat() { return m_mat; }
        const PaintStyle &style() const { return m_style; }

    private:
        xform2d m_mat;
        PaintStyle m_style;
    };

    /* Subtracts one badge's notch from every primitive of the base icon */
    class NotchCutter {
    public:
        NotchCutter(GeometryEngine &eng, const CompositeSettings &settings, CompositeStats &stats,
                ClipRegistry &clips, const Shape &notch, int badge)
            : m_eng(eng), m_settings(settings), m_stats(stats), m_clips(clips), m_notch(notch), m_badge(badge) {}

        void cut_group(CutContext &ctx, const pugi::xml_node &group);

    private:
        void cut_primitive(CutContext &ctx, const pugi::xml_node &node);
        void clip_fallback(CutContext &ctx, pugi::xml_node node, const xform2d &elem_mat, GeometryError err);
        bool unchanged(const Shape &before, const Shape &after);

        GeometryEngine &m_eng;
        const CompositeSettings &m_settings;
        CompositeStats &m_stats;
        ClipRegistry &m_clips;
        const Shape &m_notch;
        int m_badge;
    };

} /* namespace badgecut */
