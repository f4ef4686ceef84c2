#include <gtest/gtest.h>
#include "PathExporter.hxx"
#include "BSpline.hxx"
#include "LinearSpline.hxx"
#include <gmsh.h>
#include <cstdio>
#include <cmath>
#include <map>
#include <string>
#include <vector>

namespace {
static std::unique_ptr<Spline> makeHelix(int keys) {
    std::vector<double> T;
    std::vector<Spline::Point> P;
    for (int k = 0; k < keys; ++k) {
        double a = 0.75 * k;
        T.push_back(static_cast<double>(k));
        P.push_back(Spline::Point{std::cos(a), std::sin(a), 0.2 * k});
    }
    return std::make_unique<BSpline>(T, P);
}

// Open a written .msh and count the line entities of each named physical group
static std::map<std::string, std::size_t> linesPerGroup(const std::string& path, std::size_t* totalLines = nullptr) {
    std::map<std::string, std::size_t> counts;
    gmsh::initialize();
    gmsh::option::setNumber("General.Terminal", 0);
    gmsh::open(path);
    gmsh::vectorpair groups;
    gmsh::model::getPhysicalGroups(groups, 1);
    for (const auto& g : groups) {
        std::string name;
        gmsh::model::getPhysicalName(g.first, g.second, name);
        std::vector<int> tags;
        gmsh::model::getEntitiesForPhysicalGroup(g.first, g.second, tags);
        counts[name] = tags.size();
    }
    if (totalLines) {
        gmsh::vectorpair lines;
        gmsh::model::getEntities(lines, 1);
        *totalLines = lines.size();
    }
    gmsh::finalize();
    return counts;
}
}

TEST(PathExporter, WritesMsh) {
    const char* path = "test_path.msh";
    bool ok = PathExporter::writeMsh(*makeHelix(8), 6, path);
    ASSERT_TRUE(ok);
    FILE* f = std::fopen(path, "rb");
    ASSERT_NE(f, nullptr);
    std::fclose(f);

    // 7 intervals x 6 samples: one line per consecutive pair of samples
    std::size_t total = 0;
    auto groups = linesPerGroup(path, &total);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups["curve0"], 42u);
    EXPECT_EQ(total, 42u);
}

TEST(PathExporter, WritesSeveralCurves) {
    std::vector<std::unique_ptr<Spline>> curves;
    curves.push_back(makeHelix(5));
    curves.push_back(std::make_unique<LinearSpline>(std::vector<double>{0, 1, 2},
        std::vector<Spline::Point>{ {0, 0, 0}, {0, 0, 0}, {3, 0, 0} })); // stationary first segment
    const char* path = "test_paths.msh";
    ASSERT_TRUE(PathExporter::writeMsh(curves, 4, path));

    std::size_t total = 0;
    auto groups = linesPerGroup(path, &total);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups["curve0"], 16u);
    // The stationary stretch yields no zero-length lines
    EXPECT_EQ(groups["curve1"], 4u);
    EXPECT_EQ(total, 20u);
}

TEST(PathExporter, LargeCoordinatesKeepEveryLine) {
    // Earth-scale coordinates in metres
    BSpline c({0.0, 1.0, 2.0}, {Spline::Point{1e7, 0, 0}, Spline::Point{1.5e7, 0, 0}, Spline::Point{2e7, 0, 0}});
    const char* path = "test_path_large.msh";
    ASSERT_TRUE(PathExporter::writeMsh(c, 8, path));

    // 2 intervals x 8 samples = 17 samples, 16 lines
    std::size_t total = 0;
    auto groups = linesPerGroup(path, &total);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups["curve0"], 16u);
    EXPECT_EQ(total, 16u);
}

TEST(PathExporter, RejectsBadArguments) {
    std::vector<std::unique_ptr<Spline>> none;
    EXPECT_FALSE(PathExporter::writeMsh(none, 4, "unused.msh"));
    EXPECT_FALSE(PathExporter::writeMsh(*makeHelix(3), 0, "unused.msh"));
}
