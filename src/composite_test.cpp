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

#include <iostream>
#include <cmath>
#include <numbers>
#include <cstring>
#include <sstream>

#include <pugixml.hpp>
#include <badgecut.hpp>
#include "svg_path.h"

#include <minunit.h>

using namespace badgecut;
using namespace std;

char msg[1024];

static const string svg_head = "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 16 16\">";
static const string badge_dot = "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 8 8\">"
    "<circle cx=\"4\" cy=\"4\" r=\"4\" fill=\"red\"/></svg>";

static BadgeDescriptor make_badge(const string &svg, const string &anchor="br", double gap=1.0) {
    BadgeDescriptor b;
    b.svg = svg;
    b.anchor = anchor;
    b.gap = gap;
    return b;
}

static pugi::xml_node find_by_attr(const pugi::xml_node &root, const char *name, const char *value) {
    return root.find_node([name, value](const pugi::xml_node &n) {
            return n.type() == pugi::node_element && n.attribute(name) && !strcmp(n.attribute(name).value(), value);
        });
}

static size_t count_elements(const pugi::xml_node &root, const char *name) {
    size_t count = 0;
    for (const auto &n : root.children()) {
        if (n.type() != pugi::node_element)
            continue;
        if (!strcmp(n.name(), name))
            count++;
        count += count_elements(n, name);
    }
    return count;
}

/* false -> some vertex of the path data in d lies closer than r to (cx, cy), msg describes it */
static bool clear_of_disk(const char *d, double cx, double cy, double r, Shape &shape) {
    shape = Shape();
    if (!parse_path_data(d, 0.01, shape)) {
        snprintf(msg, sizeof(msg), "Cannot parse path data \"%s\"", d);
        return false;
    }

    for (const auto &poly : shape.closed) {
        for (const auto &p : poly) {
            if (hypot(p[0] - cx, p[1] - cy) < r) {
                snprintf(msg, sizeof(msg), "Point (%f, %f) lies inside the notch", p[0], p[1]);
                return false;
            }
        }
    }
    return true;
}

static bool parse_output(const string &out, pugi::xml_document &doc) {
    if (!doc.load_string(out.c_str())) {
        snprintf(msg, sizeof(msg), "Output is not well-formed: %s", out.c_str());
        return false;
    }
    return true;
}

MU_TEST(test_no_badges_is_identity) {
    string icon = svg_head + "<circle cx=\"8\" cy=\"8\" r=\"6\"/></svg>";
    CompositeSettings settings;

    ClipperGeometry eng;
    GeometricCompositor geo(eng, settings);
    mu_assert(geo.apply(icon, {}) == icon, "Geometric compositor must not touch icon without badges");

    ClipRectCompositor rect(settings);
    mu_assert(rect.apply(icon, {}) == icon, "Clip rect compositor must not touch icon without badges");

    mu_assert(geo.apply("not markup", {make_badge(badge_dot)}) == "not markup", "Unparseable icon must be returned as is");
    mu_assert_int_eq(1, geo.stats().badges_skipped);
}

MU_TEST(test_circle_notch) {
    string icon = svg_head + "<circle id=\"c\" cx=\"8\" cy=\"8\" r=\"6\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(1, comp.stats().badges_applied);
    mu_assert_int_eq(1, comp.stats().primitives_cut);
    mu_assert_int_eq(0, comp.stats().fallbacks.size());

    pugi::xml_node layer = find_by_attr(doc, "data-badge", "0");
    mu_assert(layer, "Badge layer missing");
    mu_assert(!strcmp(layer.attribute("transform").value(), "translate(10 10) scale(0.75)"),
            "Unexpected badge transform");
    mu_assert(layer.child("circle"), "Badge content should be copied into its layer");
    mu_assert(layer == doc.child("svg").last_child(), "Badge layer should be painted last");

    pugi::xml_node cut = find_by_attr(doc, "id", "c");
    mu_assert(cut && !strcmp(cut.name(), "path"), "Circle should be replaced by a path carrying its id");
    mu_assert(!cut.attribute("r") && !cut.attribute("cx"), "Geometry attributes must not be carried over");
    mu_assert(!cut.attribute("clip-path"), "Cut element must not be clipped");
    mu_assert(!cut.attribute("fill-rule"), "Notch on the rim leaves a simple contour");
    mu_assert(!find_by_attr(doc, "stroke", "none"), "Unstroked circle must not produce a stroke ring");

    Shape shape;
    mu_assert(parse_path_data(cut.attribute("d").value(), 0.01, shape), "Cut path data should parse");
    for (const auto &poly : shape.closed) {
        for (const auto &p : poly) {
            double dist = hypot(p[0] - 13.0, p[1] - 13.0);
            if (dist < 3.9) {
                snprintf(msg, sizeof(msg), "Point (%f, %f) lies inside the notch", p[0], p[1]);
                mu_fail(msg);
            }
        }
    }
}

MU_TEST(test_notch_inside_fill_is_compound) {
    string icon = svg_head + "<circle id=\"c\" cx=\"8\" cy=\"8\" r=\"7.5\" fill=\"green\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot, "c", 0.5)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node cut = find_by_attr(doc, "id", "c");
    mu_assert(cut && !strcmp(cut.name(), "path"), "Circle should be replaced by a path");
    mu_assert(!strcmp(cut.attribute("fill-rule").value(), "evenodd"), "Hole in the fill needs the even-odd rule");
    mu_assert(!strcmp(cut.attribute("fill").value(), "green"), "Fill paint should be carried over");

    Shape shape;
    mu_assert(parse_path_data(cut.attribute("d").value(), 0.01, shape), "Cut path data should parse");
    mu_assert_int_eq(2, shape.closed.size());
}

MU_TEST(test_stroke_only_rect) {
    string icon = svg_head + "<rect id=\"r\" x=\"2\" y=\"2\" width=\"12\" height=\"12\" fill=\"none\" stroke=\"red\" "
        "stroke-width=\"2\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(0, count_elements(doc, "rect"));
    pugi::xml_node ring = find_by_attr(doc, "id", "r");
    mu_assert(ring && !strcmp(ring.name(), "path"), "Stroke ring should take over the id");
    mu_assert(!strcmp(ring.attribute("fill").value(), "red"), "Ring should be filled with the stroke paint");
    mu_assert(!strcmp(ring.attribute("stroke").value(), "none"), "Ring must not be stroked");
    mu_assert(!ring.attribute("stroke-width"), "Ring must not carry stroke attributes");

    /* Only the ring is painted, no fill element besides it */
    mu_assert_int_eq(1, count_elements(doc.child("svg"), "path"));
}

MU_TEST(test_fill_before_ring) {
    string icon = svg_head + "<circle id=\"s\" cx=\"8\" cy=\"8\" r=\"6\" fill=\"yellow\" stroke=\"black\" "
        "stroke-width=\"1\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node fill = find_by_attr(doc, "id", "s");
    mu_assert(fill && !strcmp(fill.name(), "path"), "Fill element should keep the id");
    mu_assert(!strcmp(fill.attribute("fill").value(), "yellow"), "Fill element should keep the fill paint");
    mu_assert(!strcmp(fill.attribute("stroke").value(), "none"), "Fill element must not be stroked");

    pugi::xml_node ring = fill.next_sibling("path");
    mu_assert(ring, "Ring should follow the fill element");
    mu_assert(!ring.attribute("id"), "Ids must stay unique");
    mu_assert(!strcmp(ring.attribute("fill").value(), "black"), "Ring should be filled with the stroke paint");
}

MU_TEST(test_opacity_groups_fill_and_ring) {
    string icon = svg_head + "<circle cx=\"8\" cy=\"8\" r=\"6\" fill=\"yellow\" stroke=\"black\" opacity=\"0.5\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node group = find_by_attr(doc, "opacity", "0.5");
    mu_assert(group && !strcmp(group.name(), "g"), "Opacity should move to a group around fill and ring");
    mu_assert_int_eq(2, count_elements(group, "path"));
    for (const auto &path : group.children("path")) {
        mu_assert(!path.attribute("opacity"), "Grouped elements must not repeat the opacity");
    }
}

class FailingGeometry : public ClipperGeometry {
public:
    virtual GeometryError subtract(const Shape &a, const Shape &b, Shape &out) {
        (void) a, (void) b, (void) out;
        return GEOM_ENGINE_FAILURE;
    }
};

MU_TEST(test_engine_failure_clips) {
    string icon = svg_head + "<circle id=\"c\" cx=\"8\" cy=\"8\" r=\"6\" fill=\"blue\"/></svg>";
    CompositeSettings settings;
    FailingGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(1, comp.stats().badges_applied);
    mu_assert_int_eq(1, comp.stats().fallbacks.size());
    const FallbackEvent &ev = comp.stats().fallbacks[0];
    mu_assert_int_eq(0, ev.badge);
    mu_assert_int_eq(GEOM_ENGINE_FAILURE, ev.error);
    mu_assert(ev.element == "circle" && ev.id == "c", "Fallback should name the element");

    pugi::xml_node circle = find_by_attr(doc, "id", "c");
    mu_assert(circle && !strcmp(circle.name(), "circle"), "Clipped element must stay as it was");
    mu_assert(!strcmp(circle.attribute("r").value(), "6") && !strcmp(circle.attribute("fill").value(), "blue"),
            "Clipped element must keep its attributes");
    mu_assert(!strcmp(circle.attribute("clip-path").value(), "url(#nc0)"), "Element should reference the keep region");

    pugi::xml_node clip = find_by_attr(doc, "id", "nc0");
    mu_assert(clip && !strcmp(clip.name(), "clipPath"), "Keep region clipPath missing");
    mu_assert(!strcmp(clip.child("path").attribute("clip-rule").value(), "evenodd"), "Keep region must be even-odd");
}

MU_TEST(test_existing_clip_path_wrapped) {
    string icon = svg_head + "<defs><clipPath id=\"own\"><rect width=\"16\" height=\"16\"/></clipPath></defs>"
        "<g transform=\"translate(1 0)\"><circle id=\"c\" cx=\"8\" cy=\"8\" r=\"6\" clip-path=\"url(#own)\"/></g></svg>";
    CompositeSettings settings;
    FailingGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node circle = find_by_attr(doc, "id", "c");
    mu_assert(!strcmp(circle.attribute("clip-path").value(), "url(#own)"), "Own clip must be kept");
    pugi::xml_node wrapper = circle.parent();
    mu_assert(!strcmp(wrapper.name(), "g") && wrapper.attribute("clip-path"), "Element should be wrapped in a clip");
    mu_assert(strcmp(wrapper.attribute("clip-path").value(), "url(#nc0)"),
            "Wrapper inside a translated group needs a transformed clip variant");
}

MU_TEST(test_untouched_primitive) {
    string icon = svg_head + "<rect id=\"far\" x=\"1\" y=\"1\" width=\"3\" height=\"3\" fill=\"blue\"/>"
        "<circle id=\"c\" cx=\"8\" cy=\"8\" r=\"6\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    pugi::xml_document before;
    mu_assert(before.load_string(icon.c_str()), "Test icon should parse");
    ostringstream before_str;
    find_by_attr(before, "id", "far").print(before_str, "", pugi::format_raw);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    ostringstream after_str;
    find_by_attr(doc, "id", "far").print(after_str, "", pugi::format_raw);
    mu_assert(before_str.str() == after_str.str(), "Primitive away from the badge must be left as is");
    mu_assert_int_eq(1, comp.stats().primitives_untouched);
    mu_assert_int_eq(1, comp.stats().primitives_cut);
}

MU_TEST(test_group_transform_local_coordinates) {
    string icon = svg_head + "<g transform=\"translate(8 8)\"><rect id=\"t\" x=\"0\" y=\"0\" width=\"8\" height=\"8\"/>"
        "</g></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node cut = find_by_attr(doc, "id", "t");
    mu_assert(cut && !strcmp(cut.name(), "path"), "Rect should be cut");
    mu_assert(!strcmp(cut.parent().attribute("transform").value(), "translate(8 8)"),
            "Cut result should stay inside its transformed group");

    Shape shape;
    mu_assert(parse_path_data(cut.attribute("d").value(), 0.01, shape), "Cut path data should parse");
    d2p min, max;
    mu_assert(shape.bounds(min, max), "Cut shape should not be empty");
    if (min[0] < -1e-3 || min[1] < -1e-3 || max[0] > 8.001 || max[1] > 8.001) {
        snprintf(msg, sizeof(msg), "Cut result not in local coordinates: (%f, %f) - (%f, %f)",
                min[0], min[1], max[0], max[1]);
        mu_fail(msg);
    }
    mu_assert(fabs(shape.area()) < 64.0 - 1.0, "Notch should be removed from the rect");
}

MU_TEST(test_two_badges_layering) {
    string icon = svg_head + "<rect id=\"bg\" width=\"16\" height=\"16\" fill=\"gray\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    BadgeDescriptor first = make_badge(badge_dot, "br");
    BadgeDescriptor second = make_badge(badge_dot, "br");
    second.x_offset = -3.0;
    second.y_offset = -3.0;
    second.z_order = 1;

    string out = comp.apply(icon, {second, first});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(2, comp.stats().badges_applied);
    mu_assert_int_eq(1, comp.stats().layers_clipped);
    mu_assert_int_eq(0, comp.stats().fallbacks.size());

    /* Descriptor 1 has the lower z order and is painted first, so descriptor 0 clips it */
    pugi::xml_node wrapper = find_by_attr(doc, "data-badge-clip", "0");
    mu_assert(wrapper, "Earlier layer should be wrapped in a clip");
    mu_assert(!strcmp(wrapper.first_child().attribute("data-badge").value(), "1"), "Wrong layer was clipped");
    mu_assert(find_by_attr(doc, "data-badge", "0") == doc.child("svg").last_child(), "Top layer painted last");

    mu_assert(find_by_attr(doc, "data-badge", "1").child("circle"), "Clipped layer content must be intact");
}

MU_TEST(test_badges_skipped) {
    string icon = svg_head + "<circle cx=\"8\" cy=\"8\" r=\"6\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    vector<BadgeDescriptor> badges {
        make_badge("<svg viewBox=\"0 0 8 8\"><circle r=\"4\"></svg>"),
        make_badge("<svg viewBox=\"0 0 8 8\"></svg>"),
        make_badge("<svg viewBox=\"0 0 8 8\"><circle cx=\"4\" cy=\"4\" r=\"4\" fill=\"none\"/></svg>"),
    };

    string out = comp.apply(icon, badges);
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(3, comp.stats().badges_skipped);
    mu_assert_int_eq(0, comp.stats().badges_applied);
    mu_assert(!doc.find_node([](const pugi::xml_node &n) { return !n.attribute("data-badge").empty(); }),
            "Skipped badges must not be added");
    mu_assert(doc.child("svg").child("circle"), "Icon must be left intact");
}

MU_TEST(test_clip_rect_fallback) {
    string icon = svg_head + "<circle id=\"c\" cx=\"8\" cy=\"8\" r=\"6\"/></svg>";
    CompositeSettings settings;
    BadgeCompositor *comp = makeCompositor(nullptr, settings);

    BadgeDescriptor second = make_badge(badge_dot, "tl");
    string out = comp->apply(icon, {make_badge(badge_dot), second});
    CompositeStats stats = comp->stats();
    delete comp;

    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(2, stats.badges_applied);
    mu_assert_int_eq(1, stats.layers_clipped);
    mu_assert_int_eq(2, count_elements(doc, "clipPath"));
    for (const char *id : {"nc0", "nc1"}) {
        pugi::xml_node clip = find_by_attr(doc, "id", id);
        mu_assert(clip && !strcmp(clip.name(), "clipPath"), "Missing clip region");
        mu_assert(!strcmp(clip.child("path").attribute("clip-rule").value(), "evenodd"), "Clip region must be even-odd");
    }

    pugi::xml_node circle = find_by_attr(doc, "id", "c");
    mu_assert(!strcmp(circle.attribute("r").value(), "6"), "Icon content must be kept verbatim");
    mu_assert(find_by_attr(doc, "data-badge", "0") && find_by_attr(doc, "data-badge", "1"), "Badge layers missing");

    ClipRectCompositor empty_comp(settings);
    mu_assert(empty_comp.apply("<svg/>", {second}) == "<svg/>", "Icon without content must be returned as is");
    mu_assert_int_eq(1, empty_comp.stats().badges_skipped);
}

MU_TEST(test_stroked_open_path) {
    string icon = svg_head + "<path id=\"p\" d=\"M2 14H14\" fill=\"none\" stroke=\"black\" stroke-width=\"2\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(0, comp.stats().fallbacks.size());
    mu_assert_int_eq(1, comp.stats().primitives_cut);

    pugi::xml_node ring = find_by_attr(doc, "id", "p");
    mu_assert(ring && !strcmp(ring.name(), "path"), "Stroke outline should replace the path");
    mu_assert(!strcmp(ring.attribute("fill").value(), "black"), "Outline should be filled with the stroke paint");
    mu_assert(!strcmp(ring.attribute("stroke").value(), "none"), "Outline must not be stroked");

    Shape shape;
    if (!clear_of_disk(ring.attribute("d").value(), 13.0, 13.0, 3.9, shape))
        mu_fail(msg);

    d2p min, max;
    mu_assert(shape.bounds(min, max), "Outline should not be empty");
    if (fabs(min[0] - 2.0) > 1e-3 || fabs(min[1] - 13.0) > 1e-3 || fabs(max[1] - 15.0) > 1e-3 || max[0] > 9.7) {
        snprintf(msg, sizeof(msg), "Unexpected butt capped outline bounds (%f, %f) - (%f, %f)",
                min[0], min[1], max[0], max[1]);
        mu_fail(msg);
    }
}

MU_TEST(test_stroked_closed_polygon) {
    string icon = svg_head + "<polygon id=\"q\" points=\"4,4 14,4 14,14 4,14\" fill=\"none\" stroke=\"blue\" "
        "stroke-width=\"2\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(0, comp.stats().fallbacks.size());
    mu_assert_int_eq(0, count_elements(doc, "polygon"));

    pugi::xml_node ring = find_by_attr(doc, "id", "q");
    mu_assert(ring && !strcmp(ring.name(), "path"), "Ring should replace the polygon");
    mu_assert(!strcmp(ring.attribute("fill").value(), "blue"), "Ring should be filled with the stroke paint");
    mu_assert_int_eq(1, count_elements(doc.child("svg"), "path"));

    Shape shape;
    if (!clear_of_disk(ring.attribute("d").value(), 13.0, 13.0, 3.9, shape))
        mu_fail(msg);

    /* Mitered ring spans 3..15 around a 5..13 hole before the notch is taken out */
    d2p min, max;
    mu_assert(shape.bounds(min, max), "Ring should not be empty");
    mu_assert(fabs(min[0] - 3.0) < 1e-3 && fabs(min[1] - 3.0) < 1e-3, "Ring should have mitered outer corners");
    double area = fabs(shape.area());
    snprintf(msg, sizeof(msg), "Ring area %f should be below the uncut 80", area);
    mu_assert(area > 40.0 && area < 80.0 - 1.0, msg);
}

MU_TEST(test_stroked_badge_notch_covers_interior) {
    string icon = svg_head + "<rect id=\"bg\" width=\"16\" height=\"16\"/></svg>";
    string ring_badge = "<svg viewBox=\"0 0 8 8\"><circle cx=\"4\" cy=\"4\" r=\"3\" fill=\"none\" stroke=\"red\" "
        "stroke-width=\"2\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(ring_badge, "c", 0.0)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    pugi::xml_node cut = find_by_attr(doc, "id", "bg");
    mu_assert(cut && !strcmp(cut.name(), "path"), "Background should be cut");

    /* Ring of radius 4 scaled by 0.75: the whole disk of radius 3 around (8, 8) is gone, no island is left */
    Shape shape;
    if (!clear_of_disk(cut.attribute("d").value(), 8.0, 8.0, 2.95, shape))
        mu_fail(msg);
    mu_assert_int_eq(2, shape.closed.size());
    double expected = 256.0 - 9.0 * std::numbers::pi;
    snprintf(msg, sizeof(msg), "Cut area %f too far from %f", fabs(shape.area()), expected);
    mu_assert(fabs(fabs(shape.area()) - expected) < 0.5, msg);
}

MU_TEST(test_circle_buffer_engine) {
    string icon = svg_head + "<polygon id=\"q\" points=\"4,4 14,4 14,14 4,14\" fill=\"yellow\" stroke=\"blue\" "
        "stroke-width=\"2\"/></svg>";
    CompositeSettings settings;
    GeometryEngine *eng = makeGeometryEngine("clipper-approx");
    mu_assert(eng && !eng->can_offset(), "clipper-approx should not offer offsets");

    BadgeCompositor *comp = makeCompositor(eng, settings);
    string out = comp->apply(icon, {make_badge(badge_dot)});
    CompositeStats stats = comp->stats();
    delete comp;
    delete eng;

    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(1, stats.badges_applied);
    mu_assert_int_eq(1, stats.primitives_cut);
    mu_assert_int_eq(0, stats.fallbacks.size());

    pugi::xml_node fill = find_by_attr(doc, "id", "q");
    mu_assert(fill && !strcmp(fill.name(), "path"), "Fill element should replace the polygon");
    pugi::xml_node ring = fill.next_sibling("path");
    mu_assert(ring && !strcmp(ring.attribute("fill").value(), "blue"), "Ring should follow the fill element");

    /* Circle buffer notch: badge circle of radius 3 grown by 1 */
    Shape shape;
    if (!clear_of_disk(fill.attribute("d").value(), 13.0, 13.0, 3.9, shape))
        mu_fail(msg);
    if (!clear_of_disk(ring.attribute("d").value(), 13.0, 13.0, 3.9, shape))
        mu_fail(msg);
}

MU_TEST(test_degenerate_markup_clips) {
    string icon = svg_head + "<circle id=\"flat\" cx=\"8\" cy=\"8\" r=\"6\" transform=\"scale(0)\"/>"
        "<circle id=\"bad\" cx=\"8\" cy=\"8\" r=\"nan\" fill=\"red\"/></svg>";
    CompositeSettings settings;
    ClipperGeometry eng;
    GeometricCompositor comp(eng, settings);

    string out = comp.apply(icon, {make_badge(badge_dot)});
    pugi::xml_document doc;
    if (!parse_output(out, doc))
        mu_fail(msg);

    mu_assert_int_eq(2, comp.stats().fallbacks.size());
    for (const auto &ev : comp.stats().fallbacks) {
        mu_assert_int_eq(GEOM_DEGENERATE, ev.error);
        mu_assert(ev.element == "circle", "Fallback should name the element");
    }

    pugi::xml_node flat = find_by_attr(doc, "id", "flat");
    mu_assert(flat && !strcmp(flat.name(), "circle"), "Singular element must stay as it was");
    mu_assert(!strcmp(flat.attribute("transform").value(), "scale(0)") && !strcmp(flat.attribute("r").value(), "6"),
            "Singular element must keep its attributes");
    mu_assert(!strcmp(flat.attribute("clip-path").value(), "url(#nc0)"), "Singular element should be clipped");

    pugi::xml_node bad = find_by_attr(doc, "id", "bad");
    mu_assert(bad && !strcmp(bad.name(), "circle"), "Non-finite element must stay as it was");
    mu_assert(!strcmp(bad.attribute("r").value(), "nan") && !strcmp(bad.attribute("fill").value(), "red"),
            "Non-finite element must keep its attributes");
    mu_assert(!strcmp(bad.attribute("clip-path").value(), "url(#nc0)"), "Non-finite element should be clipped");
}

MU_TEST_SUITE(composite_suite) {
    MU_RUN_TEST(test_no_badges_is_identity);
    MU_RUN_TEST(test_circle_notch);
    MU_RUN_TEST(test_notch_inside_fill_is_compound);
    MU_RUN_TEST(test_stroke_only_rect);
    MU_RUN_TEST(test_fill_before_ring);
    MU_RUN_TEST(test_opacity_groups_fill_and_ring);
    MU_RUN_TEST(test_engine_failure_clips);
    MU_RUN_TEST(test_existing_clip_path_wrapped);
    MU_RUN_TEST(test_untouched_primitive);
    MU_RUN_TEST(test_group_transform_local_coordinates);
    MU_RUN_TEST(test_two_badges_layering);
    MU_RUN_TEST(test_badges_skipped);
    MU_RUN_TEST(test_clip_rect_fallback);
    MU_RUN_TEST(test_stroked_open_path);
    MU_RUN_TEST(test_stroked_closed_polygon);
    MU_RUN_TEST(test_stroked_badge_notch_covers_interior);
    MU_RUN_TEST(test_circle_buffer_engine);
    MU_RUN_TEST(test_degenerate_markup_clips);
};

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    MU_RUN_SUITE(composite_suite);
    MU_REPORT();
    return MU_EXIT_CODE;
}
