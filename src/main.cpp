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

#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <vector>
#include <algorithm>
#include <string>
#include <argagg.hpp>
#include <badgecut.hpp>

using argagg::parser_results;
using argagg::parser;
using namespace std;
using namespace badgecut;

static bool read_file(const string &fn, string &out) {
    ifstream in(fn);
    if (!in)
        return false;

    ostringstream buf;
    buf << in.rdbuf();
    out = buf.str();
    return !in.bad();
}

/* Per-badge options may be given once for all badges, or once per badge in --badge order */
template<typename T>
static T per_badge(const parser_results &args, const char *name, size_t badge, T default_value) {
    const auto &res = args[name];
    if (!res)
        return default_value;
    return res[std::min(badge, res.count() - 1)].as<T>();
}

int main(int argc, char **argv) {
    parser argparser {{
            {"help", {"-h", "--help"},
                "Print help and exit",
                0},
            {"version", {"-v", "--version"},
                "Print version and exit",
                0},
            {"badge", {"-b", "--badge"},
                "Badge SVG file to composite onto the icon. May be given multiple times, badges are painted in the given order.",
                1},
            {"x_offset", {"-x", "--x-offset"},
                "Horizontal badge offset in canvas units. Given once for all badges or once per badge. Default: 0.",
                1},
            {"y_offset", {"-y", "--y-offset"},
                "Vertical badge offset in canvas units. Given once for all badges or once per badge. Default: 0.",
                1},
            {"scale", {"-s", "--scale"},
                "Badge scale relative to its default size of 3/8 of the canvas. Given once for all badges or once per badge. Default: 1.0.",
                1},
            {"gap", {"-g", "--gap"},
                "Clearance between badge and icon in canvas units. Given once for all badges or once per badge. Default: 0.5.",
                1},
            {"anchor", {"-a", "--anchor"},
                "Badge anchor, one of tl, t, tr, l, c, r, bl, b, br (default). Given once for all badges or once per badge.",
                1},
            {"engine", {"-e", "--engine"},
                "Geometry engine. One of clipper (default), clipper-approx (no exact offsets), none (rectangular clip cutouts only).",
                1},
            {"precision", {"-p", "--precision"},
                "Number of decimal places of emitted coordinates. Default: 3.",
                1},
            {"tolerance", {"-t", "--tolerance"},
                "Tolerance in canvas units for curve flattening. Default: 0.01.",
                1},
            {"verbose", {"--verbose"},
                "Log progress of each badge pass",
                0},
    }};

    ostringstream usage;
    usage
        << argv[0] << " " << lib_version << endl
        << endl
        << "Usage: " << argv[0] << " [options]... [input_file] [output_file]" << endl
        << endl
        << "Specify \"-\" for stdin/stdout." << endl
        << endl;

    argagg::parser_results args;
    try {
        args = argparser.parse(argc, argv);
    } catch (const std::exception &e) {
        cerr << "Error: " << e.what() << endl;
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_FAILURE;
    }

    if (args["help"]) {
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_SUCCESS;
    }

    if (args["version"]) {
        cerr << lib_version << endl;
        return EXIT_SUCCESS;
    }

    string in_f_name;
    istream *in_f = &cin;
    ifstream in_f_file;
    string out_f_name;
    ostream *out_f = &cout;
    ofstream out_f_file;

    if (args.pos.size() >= 1) {
        in_f_name = args.pos[0];

        if (args.pos.size() >= 2) {
            out_f_name = args.pos[1];
        }
    }

    if (!in_f_name.empty() && in_f_name != "-") {
        in_f_file.open(in_f_name);
        if (!in_f_file) {
            cerr << "Error: Cannot open input file \"" << in_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        in_f = &in_f_file;
    }

    CompositeSettings settings;
    settings.precision = args["precision"].as<int>(3);
    settings.curve_tolerance = args["tolerance"].as<double>(0.01);
    settings.verbose = args["verbose"];

    if (settings.precision < 0 || settings.precision > 9) {
        cerr << "Error: --precision must be between 0 and 9" << endl;
        return EXIT_FAILURE;
    }

    if (!(settings.curve_tolerance > 0.0)) {
        cerr << "Error: --tolerance must be a positive number" << endl;
        return EXIT_FAILURE;
    }

    vector<BadgeDescriptor> badges;
    for (size_t i=0; i<args["badge"].count(); i++) {
        string fn = args["badge"][i].as<string>();

        BadgeDescriptor desc;
        if (!read_file(fn, desc.svg)) {
            cerr << "Error: Cannot read badge file \"" << fn << "\"" << endl;
            return EXIT_FAILURE;
        }

        desc.x_offset = per_badge<double>(args, "x_offset", i, 0.0);
        desc.y_offset = per_badge<double>(args, "y_offset", i, 0.0);
        desc.scale = per_badge<double>(args, "scale", i, 1.0);
        desc.gap = per_badge<double>(args, "gap", i, 0.5);
        desc.anchor = per_badge<string>(args, "anchor", i, "br");
        desc.z_order = (int)i;

        Anchor anchor;
        if (!parse_anchor(desc.anchor, anchor)) {
            cerr << "Error: Unknown anchor \"" << desc.anchor << "\"." << endl;
            argagg::fmt_ostream fmt(cerr);
            fmt << usage.str() << argparser;
            return EXIT_FAILURE;
        }

        badges.push_back(desc);
    }

    string engine_name = args["engine"] ? args["engine"].as<string>() : "clipper";
    transform(engine_name.begin(), engine_name.end(), engine_name.begin(), [](unsigned char c){ return std::tolower(c); });

    /* Check argument */
    GeometryEngine *engine = makeGeometryEngine(engine_name);
    if (!engine && engine_name != "none") {
        cerr << "Error: Unknown geometry engine \"" << engine_name << "\"." << endl;
        argagg::fmt_ostream fmt(cerr);
        fmt << usage.str() << argparser;
        return EXIT_FAILURE;
    }

    if (!engine) {
        cerr << "Warning: No geometry engine, badges get rectangular cutouts" << endl;
    }

    ostringstream in_buf;
    in_buf << in_f->rdbuf();
    string icon = in_buf.str();
    if (icon.empty()) {
        cerr << "Error: Input is empty" << endl;
        delete engine;
        return EXIT_FAILURE;
    }

    BadgeCompositor *compositor = makeCompositor(engine, settings);
    string result = compositor->apply(icon, badges);

    const CompositeStats &stats = compositor->stats();
    if (settings.verbose) {
        cerr << "Info: " << stats.badges_applied << " badges applied, " << stats.badges_skipped << " skipped, "
            << stats.primitives_cut << " primitives cut, " << stats.primitives_untouched << " untouched, "
            << stats.fallbacks.size() << " clipped instead of cut" << endl;
    }

    delete compositor;
    delete engine;

    if (!out_f_name.empty() && out_f_name != "-") {
        out_f_file.open(out_f_name);
        if (!out_f_file) {
            cerr << "Error: Cannot open output file \"" << out_f_name << "\"" << endl;
            return EXIT_FAILURE;
        }
        out_f = &out_f_file;
    }

    *out_f << result;
    out_f->flush();
    if (!*out_f) {
        cerr << "Error: Cannot write output" << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
