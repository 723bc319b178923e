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
#include <cstring>
#include <iostream>
#include <sstream>
#include <numeric>
#include <algorithm>

#include <badgecut.hpp>
#include "svg_doc.h"
#include "svg_geom.h"
#include "svg_shapes.h"
#include "svg_import_util.h"
#include "stroke.h"

using namespace badgecut;
using namespace std;

bool badgecut::IconDocument::load(const string &svg) {
    auto res = svg_doc.load_string(svg.c_str());
    if (!res) {
        cerr << "Warning: Cannot parse icon markup: " << res.description() << endl;
        return false;
    }

    root_elem = svg_doc.child("svg");
    if (!root_elem) {
        cerr << "Warning: Icon markup is missing root <svg> element" << endl;
        return false;
    }

    vector<double> vb;
    parse_number_list(root_elem.attribute("viewBox").value(), vb);
    if (vb.size() == 4 && vb[2] > 0.0 && vb[3] > 0.0) {
        vb_x = vb[0];
        vb_y = vb[1];
        vb_w = vb[2];
        vb_h = vb[3];

    } else {
        if (root_elem.attribute("viewBox")) {
            cerr << "Warning: Invalid viewBox, defaulting to width/height values" << endl;
        }

        double page_w = svg_double_attr(root_elem, "width", std::nan(""));
        double page_h = svg_double_attr(root_elem, "height", std::nan(""));
        if (page_w > 0.0 && page_h > 0.0) {
            vb_x = vb_y = 0.0;
            vb_w = page_w;
            vb_h = page_h;
        } else {
            cerr << "Warning: Neither width/height nor viewBox given on <svg> root element, assuming a 16x16 canvas"
                << endl;
        }
    }

    if (fabs(vb_w - vb_h) > 1e-9 * vb_w) {
        cerr << "Warning: Canvas is not square (" << vb_w << " x " << vb_h << "), placing badges relative to its width"
            << endl;
    }

    defs_node = root_elem.child("defs");
    reserve_ids(root_elem);

    _valid = true;
    return true;
}

string badgecut::IconDocument::serialize() const {
    ostringstream out;
    svg_doc.save(out, "", pugi::format_raw | pugi::format_no_declaration);
    return out.str();
}

pugi::xml_node badgecut::IconDocument::defs() {
    if (!defs_node) {
        defs_node = root_elem.prepend_child("defs");
    }
    return defs_node;
}

void badgecut::IconDocument::reserve_ids(const pugi::xml_node &node) {
    if (node.attribute("id"))
        ids.insert(node.attribute("id").value());

    for (const auto &child : node.children()) {
        if (child.type() == pugi::node_element)
            reserve_ids(child);
    }
}

string badgecut::IconDocument::unique_id(const string &base) {
    string id = base;
    for (int i=1; ids.count(id); i++) {
        id = base + "_" + to_string(i);
    }
    ids.insert(id);
    return id;
}

void badgecut::IconDocument::canvas_rect(Polygon &out) const {
    rect_polygon(vb_x, vb_y, vb_w, vb_h, out);
}

pugi::xml_node badgecut::ClipRegistry::add_clip(const string &id) {
    pugi::xml_node clip = m_doc.defs().append_child("clipPath");
    clip.append_attribute("id") = id.c_str();

    pugi::xml_node path = clip.append_child("path");
    path.append_attribute("d") = m_keep.path_data(m_precision).c_str();
    path.append_attribute("clip-rule") = "evenodd";
    return clip;
}

string badgecut::ClipRegistry::ref(const xform2d &mat) {
    if (!m_added) {
        add_clip(m_id);
        m_added = true;
    }

    if (mat.is_identity()) {
        return "url(#" + m_id + ")";
    }

    xform2d inv(mat);
    bool invertible;
    inv.invert(&invertible);
    if (!invertible) {
        /* Nothing is rendered through a singular transform anyway */
        return "url(#" + m_id + ")";
    }

    string key = inv.svg_str(12);
    auto it = m_variants.find(key);
    if (it != m_variants.end()) {
        return "url(#" + it->second + ")";
    }

    string id = m_doc.unique_id(m_id + "_" + to_string(m_variants.size() + 1));
    pugi::xml_node clip = add_clip(id);
    clip.child("path").append_attribute("transform") = key.c_str();
    m_variants[key] = id;
    return "url(#" + id + ")";
}

/* Attributes that describe the geometry or stroke of a primitive. Cut results never carry these. */
static bool geometry_or_stroke_attr(const string &name) {
    static const char *names[] = {
        "d", "x", "y", "width", "height", "rx", "ry", "cx", "cy", "r", "points", "x1", "y1", "x2", "y2",
        "pathLength", "fill-rule", "clip-rule", "marker", "marker-start", "marker-mid", "marker-end",
        "paint-order", "vector-effect",
    };

    if (name.rfind("stroke", 0) == 0)
        return true;

    for (const char *n : names) {
        if (name == n)
            return true;
    }
    return false;
}

/* Copy all non-geometry, non-stroke attributes of src onto dst */
static void copy_fill_attrs(const pugi::xml_node &src, pugi::xml_node &dst, bool strip_opacity) {
    for (const auto &attr : src.attributes()) {
        string name(attr.name());
        if (geometry_or_stroke_attr(name) || (strip_opacity && name == "opacity"))
            continue;

        if (name == "style") {
            string style = filter_style(attr.value(), [strip_opacity](const string &decl) {
                    return !geometry_or_stroke_attr(decl) && !(strip_opacity && decl == "opacity");
                });
            if (!style.empty())
                dst.append_attribute("style") = style.c_str();
            continue;
        }

        dst.append_copy(attr);
    }
}

/* Ring elements only keep what applies to the element as a whole */
static void copy_ring_attrs(const pugi::xml_node &src, pugi::xml_node &dst, bool strip_opacity) {
    static const char *names[] = {
        "transform", "opacity", "clip-path", "mask", "filter", "visibility",
    };

    for (const char *name : names) {
        if (strip_opacity && !strcmp(name, "opacity"))
            continue;

        string val = svg_prop(src, name);
        if (!val.empty())
            dst.append_attribute(name) = val.c_str();
    }
}

/* Value of an inherited property as set on node or its closest ancestor */
static string inherited_prop(pugi::xml_node node, const char *name) {
    for (; node && node.type() == pugi::node_element; node = node.parent()) {
        string val = svg_prop(node, name);
        if (!val.empty() && val != "inherit")
            return val;
    }
    return "";
}

bool badgecut::NotchCutter::unchanged(const Shape &before, const Shape &after) {
    double a = fabs(before.area());
    double b = fabs(after.area());
    return fabs(a - b) <= 1e-6 * fmax(a, 1e-12);
}

void badgecut::NotchCutter::cut_group(CutContext &ctx, const pugi::xml_node &group) {
    /* Collect first, cutting replaces nodes */
    vector<pugi::xml_node> children;
    for (const auto &node : group.children()) {
        if (node.type() == pugi::node_element)
            children.push_back(node);
    }

    for (const auto &node : children) {
        /* Badge layers are clipped by the layering pass, never cut */
        if (node.attribute("data-badge") || node.attribute("data-badge-clip"))
            continue;

        if (svg_non_rendering(node) || svg_display_none(node))
            continue;

        ElementKind kind = element_kind(node);
        if (kind == ELEM_GROUP) {
            CutContext elem_ctx(ctx, node);
            cut_group(elem_ctx, node);

        } else if (kind == ELEM_UNKNOWN) {
            cerr << "Warning: Ignoring unsupported element <" << node.name() << "> \"" << node.attribute("id").value()
                << "\"" << endl;
            m_stats.primitives_skipped++;

        } else {
            cut_primitive(ctx, node);
        }
    }
}

void badgecut::NotchCutter::cut_primitive(CutContext &ctx, const pugi::xml_node &node) {
    Primitive prim;
    if (!import_primitive(node, ctx.mat(), ctx.style(), m_settings.curve_tolerance, prim))
        return;

    if (!prim.painted())
        return;

    xform2d inv(prim.mat);
    bool invertible;
    inv.invert(&invertible);
    if (!invertible || !prim.shape.finite()) {
        clip_fallback(ctx, node, prim.mat, GEOM_DEGENERATE);
        return;
    }

    /* SVG fills open subpaths as if closed, which boolean results of the fill area cannot express */
    if (prim.style.has_fill() && !prim.shape.open.empty() && prim.kind != ELEM_LINE) {
        clip_fallback(ctx, node, prim.mat, GEOM_UNSUPPORTED);
        return;
    }

    /* Work in the element's local coordinates so its transform can stay on the replacement */
    Shape notch(m_notch);
    notch.transform(inv);

    d2p p_min, p_max, n_min, n_max;
    double margin = 0.0;
    if (prim.style.has_stroke())
        margin = prim.style.stroke_width / 2 * fmax(prim.style.miter_limit, sqrt(2.0));

    if (!prim.shape.bounds(p_min, p_max) || !notch.bounds(n_min, n_max)
            || !bounds_overlap(p_min, p_max, n_min, n_max, margin)) {
        m_stats.primitives_untouched++;
        return;
    }

    StrokeParts parts;
    GeometryError err = decompose_stroke(m_eng, prim, m_settings, parts);
    if (err != GEOM_OK) {
        clip_fallback(ctx, node, prim.mat, err);
        return;
    }

    Shape fill_cut, ring_cut;
    bool fill_same = true, ring_same = true;

    if (parts.has_fill) {
        Shape fill_norm;
        err = m_eng.normalize(parts.fill, fill_norm);
        if (err == GEOM_OK)
            err = m_eng.subtract(fill_norm, notch, fill_cut);
        if (err != GEOM_OK) {
            clip_fallback(ctx, node, prim.mat, err);
            return;
        }
        fill_same = unchanged(fill_norm, fill_cut);
    }

    if (parts.has_ring) {
        err = m_eng.subtract(parts.ring, notch, ring_cut);
        if (err != GEOM_OK) {
            clip_fallback(ctx, node, prim.mat, err);
            return;
        }
        ring_same = unchanged(parts.ring, ring_cut);
    }

    if (fill_same && ring_same) {
        m_stats.primitives_untouched++;
        return;
    }

    bool emit_fill = parts.has_fill && !fill_cut.closed.empty();
    bool emit_ring = parts.has_ring && !ring_cut.closed.empty();
    int digits = local_precision(prim.mat, m_settings.precision);
    string opacity = svg_prop(node, "opacity");

    pugi::xml_node parent = node.parent();
    pugi::xml_node target = parent;
    bool grouped = emit_fill && emit_ring && !opacity.empty();
    if (grouped) {
        /* Fill and ring overlap along the inner half of the stroke, blend them as one */
        target = parent.insert_child_before("g", node);
        target.append_attribute("opacity") = opacity.c_str();
    }

    auto insert_path = [&]() {
        return grouped ? target.append_child("path") : parent.insert_child_before("path", node);
    };

    if (emit_fill) {
        pugi::xml_node el = insert_path();
        el.append_attribute("d") = fill_cut.path_data(digits).c_str();
        copy_fill_attrs(node, el, grouped);
        if (fill_cut.is_compound())
            el.append_attribute("fill-rule") = "evenodd";
        if (prim.style.has_stroke())
            el.append_attribute("stroke") = "none";
    }

    if (emit_ring) {
        pugi::xml_node el = insert_path();
        el.append_attribute("d") = ring_cut.path_data(digits).c_str();
        if (!emit_fill && node.attribute("id"))
            el.append_copy(node.attribute("id"));
        el.append_attribute("fill") = prim.style.stroke.c_str();

        if (!prim.style.stroke_opacity.empty()) {
            el.append_attribute("fill-opacity") = prim.style.stroke_opacity.c_str();
        } else if (!inherited_prop(node, "fill-opacity").empty()) {
            el.append_attribute("fill-opacity") = "1";
        }

        if (ring_cut.is_compound())
            el.append_attribute("fill-rule") = "evenodd";
        el.append_attribute("stroke") = "none";
        copy_ring_attrs(node, el, grouped);
    }

    if (m_settings.verbose) {
        cerr << "Info: Cut <" << node.name() << "> \"" << node.attribute("id").value() << "\" ("
            << element_kind_str(prim.kind) << ")" << (emit_fill ? ", fill" : "") << (emit_ring ? ", stroke ring" : "")
            << ((!emit_fill && !emit_ring) ? ", covered entirely" : "") << endl;
    }

    parent.remove_child(node);
    m_stats.primitives_cut++;
}

void badgecut::NotchCutter::clip_fallback(CutContext &ctx, pugi::xml_node node, const xform2d &elem_mat,
        GeometryError err) {
    m_stats.fallbacks.push_back(FallbackEvent {m_badge, node.name(), node.attribute("id").value(), err});
    cerr << "Warning: Cannot cut <" << node.name() << "> \"" << node.attribute("id").value() << "\": "
        << geometry_error_str(err) << ", clipping it instead" << endl;

    if (svg_has_prop(node, "clip-path")) {
        /* Keep the element's own clip, clip a wrapper in the parent's coordinates instead */
        pugi::xml_node parent = node.parent();
        pugi::xml_node wrapper = parent.insert_child_before("g", node);
        wrapper.append_attribute("clip-path") = m_clips.ref(ctx.mat()).c_str();
        wrapper.append_move(node);
    } else {
        node.append_attribute("clip-path") = m_clips.ref(elem_mat).c_str();
    }
}

vector<size_t> badgecut::BadgeCompositor::paint_order(const vector<BadgeDescriptor> &badges) const {
    vector<size_t> order(badges.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&badges](size_t a, size_t b) {
            return badges[a].z_order < badges[b].z_order;
        });
    return order;
}

string badgecut::GeometricCompositor::apply(const string &svg, const vector<BadgeDescriptor> &badges) {
    m_stats = CompositeStats();
    if (badges.empty())
        return svg;

    IconDocument doc;
    if (!doc.load(svg)) {
        cerr << "Warning: Returning icon without badges" << endl;
        m_stats.badges_skipped = (int)badges.size();
        return svg;
    }

    vector<pugi::xml_node> layers;
    int pass = 0;
    for (size_t idx : paint_order(badges)) {
        const BadgeDescriptor &badge = badges[idx];

        Anchor anchor;
        if (!parse_anchor(badge.anchor, anchor)) {
            cerr << "Warning: Unknown anchor \"" << badge.anchor << "\" for badge " << idx << ", using br" << endl;
        }

        BadgePlacement placement = compute_badge_placement(badge.svg, doc.canvas_size(),
                badge.x_offset, badge.y_offset, badge.scale, anchor, doc.canvas_origin());
        if (placement.inner.empty()) {
            cerr << "Warning: Badge " << idx << " has no content, skipping" << endl;
            m_stats.badges_skipped++;
            continue;
        }

        /* Validate the markup before touching the icon */
        pugi::xml_document layer_doc;
        string wrapped = "<g>" + placement.inner + "</g>";
        if (!layer_doc.load_string(wrapped.c_str())) {
            cerr << "Warning: Cannot parse content of badge " << idx << ", skipping" << endl;
            m_stats.badges_skipped++;
            continue;
        }

        Shape notch;
        GeometryError err = build_notch(m_engine, badge.svg, placement, badge.gap, m_settings, notch);
        if (err != GEOM_OK) {
            cerr << "Warning: Cannot build silhouette of badge " << idx << ": " << geometry_error_str(err)
                << ", skipping" << endl;
            m_stats.badges_skipped++;
            continue;
        }

        Shape canvas;
        Polygon rect;
        doc.canvas_rect(rect);
        canvas.closed.push_back(rect);

        Shape keep;
        err = m_engine.subtract(canvas, notch, keep);
        if (err != GEOM_OK) {
            cerr << "Warning: Cannot compute keep region of badge " << idx << ": " << geometry_error_str(err)
                << ", using the even-odd combination instead" << endl;
            keep = canvas;
            keep.append(notch);
            keep.fill_rule = FILL_EVENODD;
        }

        if (m_settings.verbose) {
            cerr << "Info: Badge " << idx << " at " << placement.transform_str(m_settings.precision) << ", notch has "
                << notch.closed.size() << " contours" << endl;
        }

        ClipRegistry clips(doc, keep, doc.unique_id(m_settings.clip_id_prefix + to_string(pass)),
                m_settings.precision);
        NotchCutter cutter(m_engine, m_settings, m_stats, clips, notch, (int)idx);
        CutContext ctx(xform2d(), PaintStyle().inherit(doc.root()));
        cutter.cut_group(ctx, doc.root());

        /* Clip earlier badge layers instead of cutting them. Layers are root children, so the clip is in root
         * coordinates. */
        for (auto &layer : layers) {
            pugi::xml_node wrapper = doc.root().insert_child_before("g", layer);
            wrapper.append_attribute("clip-path") = clips.ref(xform2d()).c_str();
            wrapper.append_attribute("data-badge-clip") = (int)idx;
            wrapper.append_move(layer);
            layer = wrapper;
            m_stats.layers_clipped++;
        }

        pugi::xml_node layer = doc.root().append_child("g");
        layer.append_attribute("transform") = placement.transform_str(m_settings.precision).c_str();
        layer.append_attribute("data-badge") = (int)idx;
        for (const auto &attr : placement.root_paint) {
            layer.append_attribute(attr.first.c_str()) = attr.second.c_str();
        }
        for (const auto &child : layer_doc.child("g").children()) {
            layer.append_copy(child);
        }
        doc.reserve_ids(layer);

        layers.push_back(layer);
        m_stats.badges_applied++;
        pass++;
    }

    return doc.serialize();
}

BadgeCompositor *badgecut::makeCompositor(GeometryEngine *engine, const CompositeSettings &settings) {
    if (engine) {
        return new GeometricCompositor(*engine, settings);
    }
    return new ClipRectCompositor(settings);
}
