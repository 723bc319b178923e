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
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <numbers>

#include "svg_path.h"
#include "svg_geom.h"
#include "flatten.hpp"

using namespace std;
using namespace badgecut;

namespace {

class PathLexer {
public:
    PathLexer(const char *data) : m_p(data ? data : "") {}

    bool at_end() {
        skip_separators();
        return *m_p == '\0';
    }

    bool at_command() {
        skip_separators();
        return isalpha((unsigned char)*m_p) && *m_p != 'e' && *m_p != 'E';
    }

    char command() {
        return *m_p++;
    }

    bool number(double &out) {
        skip_separators();
        char c = *m_p;
        if (!(isdigit((unsigned char)c) || c == '.' || c == '-' || c == '+'))
            return false;

        char *endptr = nullptr;
        out = strtod(m_p, &endptr);
        if (endptr == m_p)
            return false;
        m_p = endptr;
        return true;
    }

    bool point(d2p &out) {
        return number(out[0]) && number(out[1]);
    }

    /* Arc flags may be written without any separator, e.g. "a1 1 0 011 1" */
    bool flag(bool &out) {
        skip_separators();
        if (*m_p == '0' || *m_p == '1') {
            out = *m_p == '1';
            m_p++;
            return true;
        }
        return false;
    }

private:
    void skip_separators() {
        while (*m_p && (isspace((unsigned char)*m_p) || *m_p == ','))
            m_p++;
    }

    const char *m_p;
};

class PathBuilder {
public:
    PathBuilder(Shape &out, double tolerance) : m_out(out), m_tolerance(tolerance) {}

    void move_to(d2p p) {
        finish_open();
        m_cur.push_back(p);
        m_pos = m_start = p;
    }

    void line_to(d2p p) {
        ensure_started();
        m_cur.push_back(p);
        m_pos = p;
    }

    void curve_to(d2p c1, d2p c2, d2p p) {
        ensure_started();
        curve4_div c4div(m_tolerance);
        c4div.run(m_pos, c1, c2, p);
        for (auto &pt : c4div.points()) {
            m_cur.push_back(pt);
        }
        m_pos = p;
    }

    void arc_to(double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p);

    void close() {
        if (m_cur.size() > 1) {
            const d2p &a = m_cur.front();
            const d2p &b = m_cur.back();
            if (a[0] == b[0] && a[1] == b[1])
                m_cur.pop_back();
        }

        if (m_cur.size() >= 3) {
            m_out.closed.push_back(m_cur);
        } else if (m_cur.size() == 2) {
            /* zero-area closed subpath, only visible as a stroke going there and back */
            m_out.open.push_back({m_cur[0], m_cur[1], m_cur[0]});
        }
        m_cur.clear();
        m_pos = m_start;
    }

    void finish_open() {
        if (m_cur.size() >= 2) {
            m_out.open.push_back(m_cur);
        }
        m_cur.clear();
    }

    const d2p &pos() const { return m_pos; }

private:
    void ensure_started() {
        if (m_cur.empty())
            m_cur.push_back(m_pos);
    }

    Shape &m_out;
    double m_tolerance;
    Polygon m_cur;
    d2p m_pos {0, 0};
    d2p m_start {0, 0};
};

static double vec_angle(double ux, double uy, double vx, double vy) {
    return atan2(ux*vy - uy*vx, ux*vx + uy*vy);
}

/* Endpoint to center parametrization as in SVG 1.1 appendix F.6.5, then approximation by one cubic per quarter
 * turn. */
void PathBuilder::arc_to(double rx, double ry, double rotation_deg, bool large_arc, bool sweep, d2p p) {
    if (p[0] == m_pos[0] && p[1] == m_pos[1])
        return;

    rx = fabs(rx);
    ry = fabs(ry);
    if (rx == 0 || ry == 0) {
        line_to(p);
        return;
    }

    double phi = rotation_deg * std::numbers::pi / 180.0;
    double cos_phi = cos(phi), sin_phi = sin(phi);

    double dx2 = (m_pos[0] - p[0]) / 2;
    double dy2 = (m_pos[1] - p[1]) / 2;
    double x1p =  cos_phi*dx2 + sin_phi*dy2;
    double y1p = -sin_phi*dx2 + cos_phi*dy2;

    /* Scale up radii that are too small to span the two end points */
    double lambda = (x1p*x1p)/(rx*rx) + (y1p*y1p)/(ry*ry);
    if (lambda > 1) {
        rx *= sqrt(lambda);
        ry *= sqrt(lambda);
    }

    double num = rx*rx*ry*ry - rx*rx*y1p*y1p - ry*ry*x1p*x1p;
    double den = rx*rx*y1p*y1p + ry*ry*x1p*x1p;
    double coef = (den > 0) ? sqrt(fmax(0.0, num / den)) : 0.0;
    if (large_arc == sweep)
        coef = -coef;

    double cxp =  coef * rx * y1p / ry;
    double cyp = -coef * ry * x1p / rx;
    double cx = cos_phi*cxp - sin_phi*cyp + (m_pos[0] + p[0]) / 2;
    double cy = sin_phi*cxp + cos_phi*cyp + (m_pos[1] + p[1]) / 2;

    double theta1 = vec_angle(1, 0, (x1p - cxp)/rx, (y1p - cyp)/ry);
    double dtheta = vec_angle((x1p - cxp)/rx, (y1p - cyp)/ry, (-x1p - cxp)/rx, (-y1p - cyp)/ry);
    if (!sweep && dtheta > 0)
        dtheta -= 2*std::numbers::pi;
    else if (sweep && dtheta < 0)
        dtheta += 2*std::numbers::pi;

    int segments = std::max(1, (int)ceil(fabs(dtheta) / (std::numbers::pi / 2) - 1e-9));
    double delta = dtheta / segments;
    double k = 4.0/3.0 * tan(delta / 4);

    auto arc_point = [&](double t) -> d2p {
        return d2p{
            cx + rx*cos(t)*cos_phi - ry*sin(t)*sin_phi,
            cy + rx*cos(t)*sin_phi + ry*sin(t)*cos_phi
        };
    };
    auto arc_deriv = [&](double t) -> d2p {
        return d2p{
            -rx*sin(t)*cos_phi - ry*cos(t)*sin_phi,
            -rx*sin(t)*sin_phi + ry*cos(t)*cos_phi
        };
    };

    for (int i=0; i<segments; i++) {
        double t1 = theta1 + i*delta;
        double t2 = t1 + delta;
        d2p e1 = m_pos;
        d2p e2 = (i == segments-1) ? p : arc_point(t2);
        d2p d1 = arc_deriv(t1), d2 = arc_deriv(t2);
        d2p c1 {e1[0] + k*d1[0], e1[1] + k*d1[1]};
        d2p c2 {e2[0] - k*d2[0], e2[1] - k*d2[1]};
        curve_to(c1, c2, e2);
    }
}

} /* anonymous namespace */

bool badgecut::parse_path_data(const char *data, double tolerance, Shape &out) {
    PathLexer lex(data);
    PathBuilder path(out, tolerance);

    char cmd = 0;
    char prev = 0;
    d2p last_ctrl {0, 0}; /* second control point of the previous cubic or control point of the previous quadratic */
    bool ok = true;

    while (!lex.at_end()) {
        if (lex.at_command()) {
            cmd = lex.command();
        } else if (cmd == 0) {
            ok = false;
            break;
        }
        /* else: implicit repetition of the previous command */

        bool rel = islower((unsigned char)cmd);
        d2p o = rel ? path.pos() : d2p{0, 0};
        char upper = (char)toupper((unsigned char)cmd);
        d2p a, b, c;

        switch (upper) {
            case 'M':
                if (!lex.point(a)) { ok = false; break; }
                path.move_to({o[0] + a[0], o[1] + a[1]});
                /* Further coordinate pairs are implicit lineto commands */
                cmd = rel ? 'l' : 'L';
                break;

            case 'Z':
                path.close();
                break;

            case 'L':
                if (!lex.point(a)) { ok = false; break; }
                path.line_to({o[0] + a[0], o[1] + a[1]});
                break;

            case 'H':
                if (!lex.number(a[0])) { ok = false; break; }
                path.line_to({o[0] + a[0], path.pos()[1]});
                break;

            case 'V':
                if (!lex.number(a[1])) { ok = false; break; }
                path.line_to({path.pos()[0], o[1] + a[1]});
                break;

            case 'C':
                if (!(lex.point(a) && lex.point(b) && lex.point(c))) { ok = false; break; }
                a = {o[0] + a[0], o[1] + a[1]};
                b = {o[0] + b[0], o[1] + b[1]};
                c = {o[0] + c[0], o[1] + c[1]};
                path.curve_to(a, b, c);
                last_ctrl = b;
                break;

            case 'S': {
                if (!(lex.point(b) && lex.point(c))) { ok = false; break; }
                d2p p0 = path.pos();
                if (prev == 'C' || prev == 'S') {
                    a = {2*p0[0] - last_ctrl[0], 2*p0[1] - last_ctrl[1]};
                } else {
                    a = p0;
                }
                b = {o[0] + b[0], o[1] + b[1]};
                c = {o[0] + c[0], o[1] + c[1]};
                path.curve_to(a, b, c);
                last_ctrl = b;
                break;
            }

            case 'Q':
            case 'T': {
                d2p p0 = path.pos();
                d2p q;
                if (upper == 'Q') {
                    if (!(lex.point(a) && lex.point(c))) { ok = false; break; }
                    q = {o[0] + a[0], o[1] + a[1]};
                } else {
                    if (!lex.point(c)) { ok = false; break; }
                    if (prev == 'Q' || prev == 'T') {
                        q = {2*p0[0] - last_ctrl[0], 2*p0[1] - last_ctrl[1]};
                    } else {
                        q = p0;
                    }
                }
                c = {o[0] + c[0], o[1] + c[1]};
                /* Degree elevation */
                path.curve_to(
                        {p0[0] + 2.0/3.0*(q[0] - p0[0]), p0[1] + 2.0/3.0*(q[1] - p0[1])},
                        {c[0] + 2.0/3.0*(q[0] - c[0]), c[1] + 2.0/3.0*(q[1] - c[1])},
                        c);
                last_ctrl = q;
                break;
            }

            case 'A': {
                double rx, ry, rot;
                bool large_arc, sweep;
                if (!(lex.number(rx) && lex.number(ry) && lex.number(rot)
                            && lex.flag(large_arc) && lex.flag(sweep) && lex.point(c))) {
                    ok = false;
                    break;
                }
                path.arc_to(rx, ry, rot, large_arc, sweep, {o[0] + c[0], o[1] + c[1]});
                break;
            }

            default:
                ok = false;
                break;
        }

        if (!ok)
            break;

        prev = upper;
        /* closepath takes no arguments, so it cannot repeat implicitly */
        if (upper == 'Z')
            cmd = 0;
    }

    path.finish_open();
    return ok;
}

int badgecut::count_subpaths(const char *data) {
    int count = 0;
    for (const char *p = data; p && *p; p++) {
        if (*p == 'M' || *p == 'm')
            count++;
    }
    return count;
}

/* Take a polyline and apply the given SVG dash array to it. Do this by walking the path from start to end while
 * emitting dashes. Closed contours must be passed with their first point repeated at the end. */
void badgecut::dash_path(const Polygon &in, vector<Polygon> &out, const vector<double> &dasharray, double dash_offset) {
    if (dasharray.empty() || in.size() < 2) {
        out.push_back(in);
        return;
    }

    double period = 0.0;
    for (double d : dasharray)
        period += d;
    if (period <= 0.0) {
        out.push_back(in);
        return;
    }

    dash_offset = fmod(dash_offset, period);
    if (dash_offset < 0)
        dash_offset += period;

    size_t dash_idx = 0;
    size_t num_dashes = dasharray.size();
    while (dash_offset > dasharray[dash_idx]) {
        dash_offset -= dasharray[dash_idx];
        dash_idx = (dash_idx + 1) % num_dashes;
    }

    double dash_remaining = dasharray[dash_idx] - dash_offset;

    Polygon current_dash;
    current_dash.push_back(in[0]);
    for (size_t i=1; i<in.size(); i++) {
        d2p p1(in[i-1]), p2(in[i]);
        double dist = hypot(p2[0] - p1[0], p2[1] - p1[1]);

        if (dist < dash_remaining) {
            /* dash extends beyond this segment, append this segment and continue. */
            dash_remaining -= dist;
            current_dash.push_back(p2);
            continue;
        }

        /* one or more dash boundaries fall into this segment */
        double offset = 0.0;
        while (dist - offset >= dash_remaining) {
            offset += dash_remaining;
            double frac = offset / dist;
            d2p intermediate {p1[0] + (p2[0] - p1[0]) * frac, p1[1] + (p2[1] - p1[1]) * frac};

            /* end this dash */
            current_dash.push_back(intermediate);
            /* zero-length entries of the dash array produce no visible piece */
            if (dash_idx % 2 == 0 && polygon_length(current_dash, false) > 0.0) { /* dash */
                out.push_back(current_dash);
            } /* else space */
            dash_idx = (dash_idx + 1) % num_dashes;
            dash_remaining = dasharray[dash_idx];

            /* start next dash */
            current_dash.clear();
            current_dash.push_back(intermediate);
        }

        dash_remaining -= dist - offset;
        current_dash.push_back(p2);
    }

    /* A dash starting exactly at the end of the path has no length */
    if (dash_idx % 2 == 0 && current_dash.size() >= 2 && polygon_length(current_dash, false) > 0.0) {
        out.push_back(current_dash);
    }
}
