#include "SplIO.hxx"
#include "PathExporter.hxx"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

static std::string replaceExt(const std::string& path, const std::string& newExt) {
    auto pos = path.find_last_of('.');
    if (pos == std::string::npos) return path + newExt;
    return path.substr(0, pos) + newExt;
}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::fprintf(stderr, "Usage: %s <paths.spl> <samples_per_interval> [out.msh]\n", argv[0]);
        return 2;
    }
    const std::string splPath = argv[1];
    const int samples = std::atoi(argv[2]);
    std::string mshPath = (argc >= 4) ? argv[3] : replaceExt(splPath, ".msh");

    // Load curves
    std::vector<std::unique_ptr<Spline>> curves;
    std::string err;
    if (!SplIO::readFile(splPath, curves, &err)) {
        std::fprintf(stderr, "Failed to read SPL %s: %s\n", splPath.c_str(), err.c_str());
        return 1;
    }

    // Generate path mesh
    if (!PathExporter::writeMsh(curves, samples, mshPath)) {
        std::fprintf(stderr, "Path export failed (samples_per_interval=%d, curves=%zu)\n", samples, curves.size());
        return 1;
    }
    std::printf("Wrote path mesh: %s\n", mshPath.c_str());
    return 0;
}
