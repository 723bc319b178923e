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
#include <cstdlib>
#include <algorithm>
#include "svg_import_util.h"

using namespace std;

static string trim(const string &s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == string::npos)
        return string();
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

/* Read a double value from an SVG attribute. Trailing units such as "px" are ignored. */
double badgecut::svg_double_attr(const pugi::xml_node &node, const char *attr, double default_value) {
    const auto *val = node.attribute(attr).value();
    if (*val == '\0')
        return default_value;

    return atof(val);
}

/* Look up a single declaration from a CSS style attribute value, e.g. "fill" in "fill: red; stroke: none" */
string badgecut::style_declaration(const string &style, const string &name) {
    string result;
    istringstream decls(style);
    string decl;
    while (getline(decls, decl, ';')) {
        size_t colon = decl.find(':');
        if (colon == string::npos)
            continue;

        if (trim(decl.substr(0, colon)) == name) {
            /* later declarations win */
            result = trim(decl.substr(colon + 1));
        }
    }
    return result;
}

/* Rebuild a style attribute value keeping only the declarations for which keep(name) is true. */
string badgecut::filter_style(const string &style, function<bool (const string &)> keep) {
    ostringstream out;
    bool first = true;
    istringstream decls(style);
    string decl;
    while (getline(decls, decl, ';')) {
        size_t colon = decl.find(':');
        if (colon == string::npos)
            continue;

        string name = trim(decl.substr(0, colon));
        if (!keep(name))
            continue;

        if (!first)
            out << ";";
        first = false;
        out << name << ":" << trim(decl.substr(colon + 1));
    }
    return out.str();
}

bool badgecut::svg_has_prop(const pugi::xml_node &node, const char *name) {
    return node.attribute(name) || !style_declaration(node.attribute("style").value(), name).empty();
}

/* Presentation attribute lookup. A declaration in the style attribute takes precedence over the plain attribute. */
string badgecut::svg_prop(const pugi::xml_node &node, const char *name) {
    string from_style = style_declaration(node.attribute("style").value(), name);
    if (!from_style.empty())
        return from_style;

    return trim(node.attribute(name).value());
}

void badgecut::parse_number_list(const string &val, vector<double> &out) {
    out.clear();

    string copy(val);
    replace(copy.begin(), copy.end(), ',', ' ');
    istringstream in(copy);
    double d;
    while (in >> d) {
        out.push_back(d);
    }
}
