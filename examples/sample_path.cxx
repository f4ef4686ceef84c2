#include "SplIO.hxx"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::fprintf(stderr, "Usage: %s <paths.spl> <samples_per_interval> [out.csv]\n", argv[0]);
        return 2;
    }
    const std::string splPath = argv[1];
    const int samples = std::atoi(argv[2]);
    if (samples < 1) {
        std::fprintf(stderr, "samples_per_interval must be >= 1 (got %s)\n", argv[2]);
        return 2;
    }

    std::vector<std::unique_ptr<Spline>> curves;
    std::string err;
    if (!SplIO::readFile(splPath, curves, &err)) {
        std::fprintf(stderr, "Failed to read SPL %s: %s\n", splPath.c_str(), err.c_str());
        return 1;
    }

    if (argc == 3) {
        if (!SplIO::writeSamplesCsv(std::cout, curves, samples) || !std::cout.flush()) {
            std::fprintf(stderr, "Failed to write samples to stdout\n");
            return 1;
        }
        return 0;
    }

    if (!SplIO::writeSamplesCsv(argv[3], curves, samples, &err)) {
        std::fprintf(stderr, "Failed to write CSV %s: %s\n", argv[3], err.c_str());
        return 1;
    }
    std::printf("Wrote samples of %zu curve(s): %s\n", curves.size(), argv[3]);
    return 0;
}
