#include "SplIO.hxx"
#include "BSpline.hxx"
#include "CatmullRomSpline.hxx"
#include "HermiteSpline.hxx"
#include "LinearSpline.hxx"
#include "PathSampler.hxx"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
}

static std::vector<Spline::Point> parseTriples(const std::vector<std::string>& toks, const char* what) {
    if ((toks.size() - 1) % 3 != 0) throw std::runtime_error(std::string("SPL: ") + what + " requires triples of x y z");
    std::vector<Spline::Point> pts;
    for (std::size_t i = 1; i + 2 < toks.size(); i += 3) {
        pts.push_back(Spline::Point{std::stod(toks[i]), std::stod(toks[i+1]), std::stod(toks[i+2])});
    }
    return pts;
}

static Spline::Point parseSingle(const std::vector<std::string>& toks, const char* what) {
    if (toks.size() != 4) throw std::runtime_error(std::string("SPL: ") + what + " requires x y z");
    return Spline::Point{std::stod(toks[1]), std::stod(toks[2]), std::stod(toks[3])};
}

static void writePoint(std::ostream& os, const Spline::Point& p) {
    os << ' ' << p[0] << ' ' << p[1] << ' ' << p[2];
}
}

namespace SplIO {

//
// SPL text format (3D)
// Lines starting with '*' are comments. Inline comments after '#' are ignored.
// Whitespace separated tokens.
//    spline <bspline|linear|catmullrom|hermite>
//    times <t0> <t1> ... <tn>
//    points <x0> <y0> <z0>  <x1> <y1> <z1> ... <xn> <yn> <zn>
//    first_tangent <x> <y> <z>     (catmullrom, optional)
//    last_tangent <x> <y> <z>      (catmullrom, optional)
//    in_tangents <x y z> ...       (hermite, n entries)
//    out_tangents <x y z> ...      (hermite, n entries)
//    endspline
//

struct PendingSpline {
    std::string type;
    std::vector<double> times;
    std::vector<Spline::Point> points;
    std::optional<Spline::Point> firstTangent, lastTangent;
    std::vector<Spline::Point> inTangents, outTangents;
};

static std::unique_ptr<Spline> finishOrThrow(PendingSpline& s) {
    std::unique_ptr<Spline> c;
    const bool catmull = s.type == "catmullrom";
    const bool hermite = s.type == "hermite";
    if (!catmull && (s.firstTangent || s.lastTangent)) throw std::runtime_error("SPL: first_tangent/last_tangent only apply to catmullrom");
    if (!hermite && (!s.inTangents.empty() || !s.outTangents.empty())) throw std::runtime_error("SPL: in_tangents/out_tangents only apply to hermite");
    if (catmull) {
        c = std::make_unique<CatmullRomSpline>(std::move(s.times), std::move(s.points), s.firstTangent, s.lastTangent);
    } else if (hermite) {
        c = std::make_unique<HermiteSpline>(std::move(s.times), std::move(s.points), std::move(s.inTangents), std::move(s.outTangents));
    } else {
        c = makeSpline(s.type, std::move(s.times), std::move(s.points));
    }
    std::string why; if (!c->isValid(&why)) throw std::runtime_error(std::string("SPL: invalid spline: ") + why);
    return c;
}

std::unique_ptr<Spline> makeSpline(const std::string& type,
                                   std::vector<double> times,
                                   std::vector<Spline::Point> points) {
    if (type == "bspline") return std::make_unique<BSpline>(std::move(times), std::move(points));
    if (type == "linear") return std::make_unique<LinearSpline>(std::move(times), std::move(points));
    if (type == "catmullrom") return std::make_unique<CatmullRomSpline>(std::move(times), std::move(points));
    if (type == "hermite") {
        // No tangents given: HermiteSpline rejects this with MissingArgument
        return std::make_unique<HermiteSpline>(std::move(times), std::move(points),
                                               std::vector<Spline::Point>{}, std::vector<Spline::Point>{});
    }
    throw std::runtime_error("SPL: unknown spline type '" + type + "'");
}

bool readFile(const std::string& path, std::vector<std::unique_ptr<Spline>>& out) {
    std::ifstream ifs(path);
    if (!ifs) return false;
    std::string line;
    std::vector<std::string> toks;
    bool inSpline = false;
    PendingSpline cur;

    while (std::getline(ifs, line)) {
        // Strip inline comments after '#'
        auto hashPos = line.find('#');
        if (hashPos != std::string::npos) line = line.substr(0, hashPos);
        std::string t = trim(line);
        if (t.empty()) continue;
        if (t[0] == '*') continue; // full-line comment

        splitTokens(t, toks);
        if (toks.empty()) continue;
        if (!inSpline) {
            if (toks[0] != "spline") throw std::runtime_error("SPL: expected 'spline'");
            if (toks.size() != 2) throw std::runtime_error("SPL: 'spline' requires a type");
            cur = PendingSpline{};
            cur.type = toks[1];
            inSpline = true;
        } else if (toks[0] == "times") {
            for (std::size_t i = 1; i < toks.size(); ++i) cur.times.push_back(std::stod(toks[i]));
        } else if (toks[0] == "points") {
            auto pts = parseTriples(toks, "points");
            cur.points.insert(cur.points.end(), pts.begin(), pts.end());
        } else if (toks[0] == "first_tangent") {
            cur.firstTangent = parseSingle(toks, "first_tangent");
        } else if (toks[0] == "last_tangent") {
            cur.lastTangent = parseSingle(toks, "last_tangent");
        } else if (toks[0] == "in_tangents") {
            auto pts = parseTriples(toks, "in_tangents");
            cur.inTangents.insert(cur.inTangents.end(), pts.begin(), pts.end());
        } else if (toks[0] == "out_tangents") {
            auto pts = parseTriples(toks, "out_tangents");
            cur.outTangents.insert(cur.outTangents.end(), pts.begin(), pts.end());
        } else if (toks[0] == "endspline") {
            out.push_back(finishOrThrow(cur));
            inSpline = false;
        } else {
            throw std::runtime_error("SPL: unknown token '" + toks[0] + "' in spline block");
        }
    }
    if (inSpline) throw std::runtime_error("SPL: unterminated spline block");
    return true;
}

bool readFile(const std::string& path, std::vector<std::unique_ptr<Spline>>& out, std::string* errorMessage) {
    try {
        if (!readFile(path, out)) {
            if (errorMessage) *errorMessage = "Could not open spl file for reading";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves) {
    std::ofstream ofs(path);
    if (!ofs) return false;
    ofs << std::setprecision(std::numeric_limits<double>::max_digits10);
    ofs << "* SplinePath SPL 3D format\n";
    for (const auto& c : curves) {
        if (!c) throw std::runtime_error("SPL: null curve in write");
        ofs << "spline " << c->typeName() << "\n";
        ofs << "times";
        for (double t : c->times()) ofs << ' ' << t;
        ofs << "\npoints";
        for (const auto& p : c->points()) writePoint(ofs, p);
        ofs << '\n';
        if (auto* cr = dynamic_cast<const CatmullRomSpline*>(c.get())) {
            if (cr->hasExplicitFirstTangent()) { ofs << "first_tangent"; writePoint(ofs, cr->firstTangent()); ofs << '\n'; }
            if (cr->hasExplicitLastTangent()) { ofs << "last_tangent"; writePoint(ofs, cr->lastTangent()); ofs << '\n'; }
        } else if (auto* h = dynamic_cast<const HermiteSpline*>(c.get())) {
            ofs << "in_tangents";
            for (const auto& m : h->inTangents()) writePoint(ofs, m);
            ofs << "\nout_tangents";
            for (const auto& m : h->outTangents()) writePoint(ofs, m);
            ofs << '\n';
        }
        ofs << "endspline\n\n";
    }
    return static_cast<bool>(ofs);
}

bool writeFile(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves, std::string* errorMessage) {
    try {
        if (!writeFile(path, curves)) {
            if (errorMessage) *errorMessage = "Could not write spl file";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeSamplesCsv(std::ostream& os, const std::vector<std::unique_ptr<Spline>>& curves, int samplesPerInterval) {
    os << std::setprecision(std::numeric_limits<double>::max_digits10);
    os << "curve,type,time,x,y,z\n";
    for (std::size_t k = 0; k < curves.size(); ++k) {
        if (!curves[k]) throw std::runtime_error("SPL: null curve in write");
        const std::string type = curves[k]->typeName();
        for (const auto& s : PathSampler::sample(*curves[k], samplesPerInterval)) {
            os << k << ',' << type << ',' << s.time << ','
               << s.point[0] << ',' << s.point[1] << ',' << s.point[2] << '\n';
        }
    }
    return static_cast<bool>(os);
}

bool writeSamplesCsv(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves,
                     int samplesPerInterval, std::string* errorMessage) {
    try {
        std::ofstream ofs(path);
        if (!ofs) {
            if (errorMessage) *errorMessage = "Could not open " + path + " for writing";
            return false;
        }
        bool ok = writeSamplesCsv(ofs, curves, samplesPerInterval);
        ofs.close();
        if (!ok || ofs.fail()) {
            if (errorMessage) *errorMessage = "Could not write " + path;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace SplIO
