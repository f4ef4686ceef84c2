#include <gtest/gtest.h>
#include "BSpline.hxx"
#include "SplineError.hxx"
#include <cmath>

namespace {
using P3 = Spline::Point;

template <class F>
SplineError::Code errorCode(F&& f) {
    try {
        f();
    } catch (const SplineError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected SplineError";
    return SplineError::Code::MissingArgument;
}

BSpline makeScenario() {
    return BSpline({0, 1, 2, 3}, {P3{0, 0, 0}, P3{1, 0, 0}, P3{2, 1, 0}, P3{3, 1, 0}});
}
}

TEST(BSpline, BasisPartitionOfUnity) {
    for (int k = 0; k <= 100; ++k) {
        double u = k / 100.0;
        auto w = BSpline::basisWeights(u);
        EXPECT_NEAR(w[0] + w[1] + w[2] + w[3], 1.0, 1e-14) << "u=" << u;
        for (double wi : w) EXPECT_GE(wi, -1e-15); // cubic terms may round just below zero at u = 1
    }
    auto w0 = BSpline::basisWeights(0.0);
    EXPECT_NEAR(w0[0], 1.0 / 6.0, 1e-15);
    EXPECT_NEAR(w0[1], 4.0 / 6.0, 1e-15);
    EXPECT_NEAR(w0[2], 1.0 / 6.0, 1e-15);
    EXPECT_NEAR(w0[3], 0.0, 1e-15);
}

TEST(BSpline, InteriorScenario) {
    BSpline c = makeScenario();
    auto p = c.evaluate(1.5);
    EXPECT_GT(p[0], 1.0); EXPECT_LT(p[0], 2.0);
    EXPECT_GT(p[1], 0.0); EXPECT_LT(p[1], 1.0);
    // Symmetric window at u = 0.5 gives weights (1, 23, 23, 1) / 48
    EXPECT_NEAR(p[0], 1.5, 1e-12);
    EXPECT_NEAR(p[1], 0.5, 1e-12);
    EXPECT_NEAR(p[2], 0.0, 1e-12);
}

TEST(BSpline, EndpointsEvaluateAndInterpolate) {
    std::vector<P3> P{P3{0, 0, 0}, P3{1, 2, -1}, P3{3, 3, 2}};
    BSpline c({0, 1, 2}, P);
    auto a = c.evaluate(c.tMin());
    auto b = c.evaluate(c.tMax());
    for (int k = 0; k < 3; ++k) {
        EXPECT_TRUE(std::isfinite(a[k]));
        EXPECT_TRUE(std::isfinite(b[k]));
        EXPECT_NEAR(a[k], P.front()[k], 1e-12);
        EXPECT_NEAR(b[k], P.back()[k], 1e-12);
    }
}

TEST(BSpline, ResultIndependentOfCallHistory) {
    BSpline c({0, 1, 2, 3, 4, 5}, {P3{0, 0, 0}, P3{1, 3, 0}, P3{2, -1, 1}, P3{4, 0, 2}, P3{5, 2, 2}, P3{6, 0, 0}});
    const double t1 = 3.7, t2 = 0.2;
    auto first = c.evaluate(t1);
    auto other = c.evaluate(t2);
    auto again = c.evaluate(t1);
    // Bit-identical, not merely close
    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);

    BSpline fresh({0, 1, 2, 3, 4, 5}, {P3{0, 0, 0}, P3{1, 3, 0}, P3{2, -1, 1}, P3{4, 0, 2}, P3{5, 2, 2}, P3{6, 0, 0}});
    EXPECT_EQ(fresh.evaluate(t1), first);
}

TEST(BSpline, ContinuousAcrossKnots) {
    BSpline c({0, 0.5, 2, 2.5, 4, 7}, {P3{0, 0, 0}, P3{1, 1, 0}, P3{2, 0, 1}, P3{3, 1, 1}, P3{4, 0, 0}, P3{6, 2, 1}});
    const double eps = 1e-9;
    for (std::size_t i = 1; i + 1 < c.numPoints(); ++i) {
        double t = c.times()[i];
        auto left = c.evaluate(t - eps);
        auto at = c.evaluate(t);
        auto right = c.evaluate(t + eps);
        for (int k = 0; k < 3; ++k) {
            EXPECT_NEAR(left[k], at[k], 1e-6) << "knot " << i;
            EXPECT_NEAR(right[k], at[k], 1e-6) << "knot " << i;
        }
    }
}

TEST(BSpline, ControlWindowPhantomPoints) {
    std::vector<P3> P{P3{0, 0, 0}, P3{1, 0, 0}, P3{1, 1, 0}, P3{0, 1, 0}};
    BSpline c({0, 1, 2, 3}, P);
    EXPECT_EQ(c.windowKind(0), BSpline::Window::First);
    EXPECT_EQ(c.windowKind(1), BSpline::Window::Interior);
    EXPECT_EQ(c.windowKind(2), BSpline::Window::Last);

    auto first = c.controlWindow(0);
    EXPECT_EQ(first[0], (P3{-1, 0, 0})); // P0 + (P0 - P1)
    EXPECT_EQ(first[1], P[0]);
    EXPECT_EQ(first[3], P[2]);

    auto last = c.controlWindow(2);
    EXPECT_EQ(last[0], P[1]);
    EXPECT_EQ(last[3], (P3{-1, 1, 0})); // P3 + (P3 - P2)

    auto mid = c.controlWindow(1);
    EXPECT_EQ(mid[0], P[0]);
    EXPECT_EQ(mid[3], P[3]);
}

TEST(BSpline, TwoPointsIsStraightSegment) {
    BSpline c({2, 4}, {P3{0, 0, 0}, P3{2, 4, -2}});
    EXPECT_EQ(c.windowKind(0), BSpline::Window::Single);
    for (int k = 0; k <= 10; ++k) {
        double s = k / 10.0;
        auto p = c.evaluate(2.0 + 2.0 * s);
        EXPECT_NEAR(p[0], 2.0 * s, 1e-12);
        EXPECT_NEAR(p[1], 4.0 * s, 1e-12);
        EXPECT_NEAR(p[2], -2.0 * s, 1e-12);
    }
}

TEST(BSpline, OutputParameter) {
    BSpline c = makeScenario();
    Spline::Point out{9, 9, 9};
    Spline::Point& ref = c.evaluate(1.5, out);
    EXPECT_EQ(&ref, &out);
    EXPECT_EQ(out, c.evaluate(1.5));
}

TEST(BSpline, ConstructionErrors) {
    EXPECT_EQ(errorCode([] { BSpline c({0}, {P3{0, 0, 0}}); }), SplineError::Code::InvalidLength);
    EXPECT_EQ(errorCode([] { BSpline c({0, 1, 2}, {P3{0, 0, 0}, P3{1, 0, 0}}); }), SplineError::Code::LengthMismatch);
    EXPECT_EQ(errorCode([] { BSpline c({}, {P3{0, 0, 0}, P3{1, 0, 0}}); }), SplineError::Code::MissingArgument);
    EXPECT_EQ(errorCode([] { BSpline c({0, 1}, {}); }), SplineError::Code::MissingArgument);
}

TEST(BSpline, EvaluateOutOfRange) {
    BSpline c = makeScenario();
    EXPECT_EQ(errorCode([&] { c.evaluate(c.tMax() + 1.0); }), SplineError::Code::OutOfRange);
    EXPECT_EQ(errorCode([&] { c.evaluate(c.tMin() - 1.0); }), SplineError::Code::OutOfRange);
    // Failed call leaves the curve usable
    auto p = c.evaluate(1.5);
    EXPECT_NEAR(p[0], 1.5, 1e-12);
}

TEST(BSpline, IsValidReportsUnorderedTimes) {
    BSpline ok = makeScenario();
    std::string why;
    EXPECT_TRUE(ok.isValid(&why)) << why;

    BSpline bad({0, 2, 1}, {P3{0, 0, 0}, P3{1, 0, 0}, P3{2, 0, 0}});
    EXPECT_FALSE(bad.isValid(&why));
    EXPECT_EQ(why, "Times must be strictly increasing");
}
