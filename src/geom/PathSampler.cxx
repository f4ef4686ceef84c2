#include "PathSampler.hxx"

#include <stdexcept>

std::vector<PathSample> PathSampler::sample(const Spline& c, int samplesPerInterval) {
    if (samplesPerInterval < 1) throw std::invalid_argument("PathSampler: samplesPerInterval must be >= 1");
    const auto& T = c.times();
    std::vector<PathSample> out;
    out.reserve((T.size() - 1) * static_cast<std::size_t>(samplesPerInterval) + 1);
    for (std::size_t i = 0; i + 1 < T.size(); ++i) {
        const double t0 = T[i];
        const double dt = T[i + 1] - t0;
        for (int k = 0; k < samplesPerInterval; ++k) {
            const double t = t0 + dt * (static_cast<double>(k) / samplesPerInterval);
            out.push_back({t, c.evaluate(t)});
        }
    }
    out.push_back({c.tMax(), c.evaluate(c.tMax())});
    return out;
}

std::vector<PathSample> PathSampler::sampleUniform(const Spline& c, int count) {
    if (count < 2) throw std::invalid_argument("PathSampler: count must be >= 2");
    const double a = c.tMin();
    const double b = c.tMax();
    std::vector<PathSample> out;
    out.reserve(static_cast<std::size_t>(count));
    for (int k = 0; k < count; ++k) {
        // Last sample pinned to b so rounding never leaves the domain
        const double t = (k == count - 1) ? b : a + (b - a) * (static_cast<double>(k) / (count - 1));
        out.push_back({t, c.evaluate(t)});
    }
    return out;
}
