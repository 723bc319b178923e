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

#include <math.h>
#include <cmath>
#include <stdlib.h>
#include <limits>
#include <vector>
#include <string>
#include <iostream>
#include <sstream>
#include <functional>

#include <pugixml.hpp>

namespace badgecut {

double svg_double_attr(const pugi::xml_node &node, const char *attr, double default_value=0.0);
bool svg_has_prop(const pugi::xml_node &node, const char *name);
std::string svg_prop(const pugi::xml_node &node, const char *name);
std::string style_declaration(const std::string &style, const std::string &name);
std::string filter_style(const std::string &style, std::function<bool (const std::string &)> keep);
void parse_number_list(const std::string &val, std::vector<double> &out);

} /* namespace badgecut */
