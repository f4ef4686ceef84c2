#ifndef SPLINEPATH_PATH_SAMPLER_HXX
#define SPLINEPATH_PATH_SAMPLER_HXX

#include "Spline.hxx"
#include <vector>

// A sampled point on a curve together with the time it was taken at
struct PathSample {
    double time;
    Spline::Point point;
};

class PathSampler {
public:
    // Sample every knot interval with samplesPerInterval equal steps.
    // Knot times are hit exactly; the last sample is at tMax().
    // Result size: (numPoints() - 1) * samplesPerInterval + 1.
    // Throws std::invalid_argument if samplesPerInterval < 1.
    static std::vector<PathSample> sample(const Spline& c, int samplesPerInterval);

    // count samples at uniformly spaced times over [tMin, tMax] (count >= 2)
    static std::vector<PathSample> sampleUniform(const Spline& c, int count);
};

#endif // SPLINEPATH_PATH_SAMPLER_HXX
