#include "PathExporter.hxx"
#include "PathSampler.hxx"
#include <gmsh.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

// Distance below which two consecutive samples count as the same point,
// relative to the extent of the sampled curve
static double mergeTolerance(const std::vector<PathSample>& samples) {
    Spline::Point lo = samples.front().point;
    Spline::Point hi = lo;
    for (const auto& s : samples) {
        for (int k = 0; k < 3; ++k) {
            lo[k] = std::min(lo[k], s.point[k]);
            hi[k] = std::max(hi[k], s.point[k]);
        }
    }
    const double diag = std::sqrt((hi[0] - lo[0]) * (hi[0] - lo[0]) +
                                  (hi[1] - lo[1]) * (hi[1] - lo[1]) +
                                  (hi[2] - lo[2]) * (hi[2] - lo[2]));
    return 1e-12 * diag;
}

static double distance(const Spline::Point& a, const Spline::Point& b) {
    const double dx = a[0] - b[0], dy = a[1] - b[1], dz = a[2] - b[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

static int addPoint(const Spline::Point& p, int& nextPointTag) {
    int tag = nextPointTag++;
    gmsh::model::geo::addPoint(p[0], p[1], p[2], 0.0, tag);
    return tag;
}

// Add one sampled curve as a chain of lines; returns the line tags
static std::vector<int> addPathEntities(const Spline& c, int samplesPerInterval,
                                        int& nextPointTag, int& nextLineTag) {
    const auto samples = PathSampler::sample(c, samplesPerInterval);
    const double tol = mergeTolerance(samples);
    std::vector<int> lines;
    Spline::Point prevPoint = samples.front().point;
    int prev = addPoint(prevPoint, nextPointTag);
    for (std::size_t k = 1; k < samples.size(); ++k) {
        if (distance(samples[k].point, prevPoint) <= tol) continue; // stationary stretch, no zero-length line
        int cur = addPoint(samples[k].point, nextPointTag);
        int lineTag = nextLineTag++;
        gmsh::model::geo::addLine(prev, cur, lineTag);
        lines.push_back(lineTag);
        prev = cur;
        prevPoint = samples[k].point;
    }
    return lines;
}

static bool writeCurves(const std::vector<const Spline*>& curves,
                        int samplesPerInterval,
                        const std::string& mshPath) {
    if (samplesPerInterval < 1 || curves.empty()) return false;
    gmsh::initialize();
    gmsh::model::add("splinepath");
    // Tag counters (reset per call)
    int nextPointTag = 1;
    int nextLineTag = 1;
    std::vector<std::vector<int>> curveLines;
    for (const Spline* c : curves) {
        curveLines.push_back(addPathEntities(*c, samplesPerInterval, nextPointTag, nextLineTag));
    }
    gmsh::model::geo::synchronize();
    for (std::size_t k = 0; k < curveLines.size(); ++k) {
        if (curveLines[k].empty()) continue;
        int group = gmsh::model::addPhysicalGroup(1, curveLines[k]);
        gmsh::model::setPhysicalName(1, group, "curve" + std::to_string(k));
    }
    gmsh::model::mesh::generate(1);
    gmsh::write(mshPath);
    gmsh::finalize();
    return true;
}

bool PathExporter::writeMsh(const std::vector<std::unique_ptr<Spline>>& curves,
                            int samplesPerInterval,
                            const std::string& mshPath) {
    std::vector<const Spline*> raw;
    for (const auto& c : curves) if (c) raw.push_back(c.get());
    return writeCurves(raw, samplesPerInterval, mshPath);
}

bool PathExporter::writeMsh(const Spline& curve,
                            int samplesPerInterval,
                            const std::string& mshPath) {
    return writeCurves({&curve}, samplesPerInterval, mshPath);
}
