#ifndef PATH_EXPORTER_HXX
#define PATH_EXPORTER_HXX

#include "Spline.hxx"
#include <memory>
#include <string>
#include <vector>

class PathExporter {
public:
    // Sample each curve (PathSampler::sample), build a Gmsh geometry of points joined by
    // straight lines, generate the 1D mesh and write it to mshPath.
    // Each curve becomes a physical group named "curve<k>". Consecutive samples closer than
    // 1e-12 of the curve's bounding-box diagonal are joined, so stationary stretches add no lines.
    // Returns false if samplesPerInterval < 1 or there is nothing to export.
    // (Gmsh is required at build time.)
    static bool writeMsh(const std::vector<std::unique_ptr<Spline>>& curves,
                         int samplesPerInterval,
                         const std::string& mshPath);

    static bool writeMsh(const Spline& curve,
                         int samplesPerInterval,
                         const std::string& mshPath);
};

#endif // PATH_EXPORTER_HXX
