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

#include <array>
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <cmath>
#include <cctype>
#include <tuple>
#include <algorithm>
#include <numbers>

using namespace std;

namespace badgecut {

    typedef std::array<double, 2> d2p;
    typedef std::vector<d2p> Polygon;

    class xform2d {
        public:
            xform2d(double xx, double xy, double yx, double yy, double x0=0.0, double y0=0.0) :
                xx(xx), xy(xy), x0(x0), yx(yx), yy(yy), y0(y0) {}
            
            xform2d() : xform2d(1.0, 0.0, 0.0, 1.0) {}

            /* Parse an SVG transform list such as "translate(4 4) rotate(45) scale(2)". The resulting matrix applies
             * the rightmost operation first, like SVG does. Unparseable trailing garbage ends parsing, everything
             * up to that point is kept. */
            xform2d(const string &svg_transform) : xform2d() {
                size_t pos = 0;
                while (pos < svg_transform.size()) {
                    pos = svg_transform.find_first_not_of(" \t\r\n,", pos);
                    if (pos == string::npos)
                        return;

                    size_t paren = svg_transform.find('(', pos);
                    if (paren == string::npos)
                        return;
                    size_t close = svg_transform.find(')', paren);
                    if (close == string::npos)
                        return;

                    string name = svg_transform.substr(pos, paren - pos);
                    name.erase(std::remove_if(name.begin(), name.end(), [](unsigned char c){ return std::isspace(c); }), name.end());

                    string args = svg_transform.substr(paren+1, close-paren-1);
                    std::replace(args.begin(), args.end(), ',', ' ');
                    istringstream arg_stream(args);
                    vector<double> a;
                    double v;
                    while (arg_stream >> v)
                        a.push_back(v);

                    if (!apply_op(name, a))
                        return;

                    pos = close + 1;
                }
            }

            xform2d &translate(double x, double y) {
                xform2d xf(1, 0, 0, 1, x, y);
                transform(xf);
                return *this;
            }

            xform2d &scale(double x, double y) {
                xform2d xf(x, 0, 0, y);
                transform(xf);
                return *this;
            }

            xform2d &rotate(double theta) {
                double s = sin(theta);
                double c = cos(theta);
                xform2d xf(c, -s, s, c);
                transform(xf);
                return *this;
            }

            xform2d &skew(double m) {
                xform2d xf(1, m, 0, 1);
                transform(xf);
                return *this;
            }

            xform2d &skew_y(double m) {
                xform2d xf(1, 0, m, 1);
                transform(xf);
                return *this;
            }

            xform2d &transform(const xform2d &other) {
                double n_xx = other.xx * xx + other.yx * xy;
                double n_yx = other.xx * yx + other.yx * yy;

                double n_xy = other.xy * xx + other.yy * xy;
                double n_yy = other.xy * yx + other.yy * yy;

                double n_x0 = other.x0 * xx + other.y0 * xy + x0;
                double n_y0 = other.x0 * yx + other.y0 * yy + y0;

                xx = n_xx;
                yx = n_yx;
                xy = n_xy;
                yy = n_yy;
                x0 = n_x0;
                y0 = n_y0;
                decomposed = false;

                return *this;
            };

            std::tuple<double, double, double, double> decompose() {
                if (decomposed) {
                    return {s_x, s_y, m, theta};
                }

                /* https://math.stackexchange.com/a/3521141 */
                /* https://stackoverflow.com/a/70381885 */
                /* xx xy x0
                 * yx yy y0 */
                s_x = sqrt(xx*xx + yx*yx);

                if (xx == 0 && yx == 0) {
                    theta = 0;
                } else {
                    theta = atan2(yx, xx);
                }

                double f = (xx*yy - xy*yx);

                if (f == 0) {
                    m = 0;
                } else {
                    m = (xx*xy + yy*yx) / f;
                }

                f = xx + m*yx;
                if (fabs(f) < 1e-12) {
                    f = m*xx - yx;
                    if (fabs(f) < 1e-12) {
                        s_y = 0;
                    } else {
                        s_y = xy*s_x / f;
                    }
                } else {
                    s_y = yy*s_x / f;
                }

                double b = sqrt(s_y*s_y + m*m);
                f_min = fmin(s_x, b);
                f_max = fmax(s_x, b);

                decomposed = true;
                return {s_x, s_y, m, theta};
            }

            double doc2phys_max(double dist_doc) {
                decompose();
                return dist_doc * f_max;
            }

            double phys2doc_min(double dist_doc) {
                decompose();

                if (f_min == 0)
                    return std::nan("9");

                return dist_doc / f_min;
            }

            d2p doc2phys(const d2p p) const {
                return d2p {
                    xx * p[0] + xy * p[1] + x0,
                    yx * p[0] + yy * p[1] + y0
                };
            }

            xform2d &invert(bool *success_out=nullptr) {
                /* From Cairo source */

                /* inv (A) = 1/det (A) * adj (A) */
                double det = xx*yy - yx*xy;

                if (det == 0 || !isfinite(det)) {
                    if (success_out)
                        *success_out = false;
                    *this = xform2d(); /* unity matrix */
                    return *this;
                }

                *this = xform2d(yy/det, -xy/det,
                        -yx/det, xx/det,
                        (xy*y0 - yy*x0)/det, (yx*x0 - xx*y0)/det);

                if (success_out)
                    *success_out = true;

                return *this;
            }

            bool is_identity(double eps=1e-12) const {
                return fabs(xx - 1.0) < eps && fabs(yy - 1.0) < eps
                    && fabs(xy) < eps && fabs(yx) < eps
                    && fabs(x0) < eps && fabs(y0) < eps;
            }

            void transform_polygon(Polygon &poly) const {
                std::transform(poly.begin(), poly.end(), poly.begin(),
                        [this](d2p p) -> d2p {
                            return this->doc2phys(d2p{p[0], p[1]});
                        });
            }

            /* Format as an SVG matrix() transform. */
            string svg_str(int digits=6) const {
                ostringstream os;
                os << setprecision(digits);
                os << "matrix(" << xx << " " << yx << " " << xy << " " << yy << " " << x0 << " " << y0 << ")";
                return os.str();
            }

        private:
            bool apply_op(const string &name, const vector<double> &a) {
                constexpr double deg = std::numbers::pi / 180.0;

                if (name == "matrix") {
                    if (a.size() != 6)
                        return false;
                    /* SVG order is a b c d e f, i.e. column-major */
                    transform(xform2d(a[0], a[2], a[1], a[3], a[4], a[5]));

                } else if (name == "translate") {
                    if (a.empty() || a.size() > 2)
                        return false;
                    translate(a[0], a.size() > 1 ? a[1] : 0.0);

                } else if (name == "scale") {
                    if (a.empty() || a.size() > 2)
                        return false;
                    scale(a[0], a.size() > 1 ? a[1] : a[0]);

                } else if (name == "rotate") {
                    if (a.size() == 1) {
                        rotate(a[0] * deg);
                    } else if (a.size() == 3) {
                        translate(a[1], a[2]);
                        rotate(a[0] * deg);
                        translate(-a[1], -a[2]);
                    } else {
                        return false;
                    }

                } else if (name == "skewX") {
                    if (a.size() != 1)
                        return false;
                    skew(tan(a[0] * deg));

                } else if (name == "skewY") {
                    if (a.size() != 1)
                        return false;
                    skew_y(tan(a[0] * deg));

                } else {
                    return false;
                }

                return true;
            }

            double xx, xy, x0,
                   yx, yy, y0;
            double theta, m, s_x, s_y;
            double f_min, f_max;
            bool decomposed = false;
    };
}
