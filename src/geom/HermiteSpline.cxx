// Implementation for HermiteSpline class
#include "HermiteSpline.hxx"
#include "SplineError.hxx"

#include <cmath>
#include <utility>

namespace {
// Rows map (u^3, u^2, u, 1) to h00, h01, h10, h11
constexpr double kHermite[4][4] = {
	{  2.0, -3.0,  0.0,  1.0 },
	{ -2.0,  3.0,  0.0,  0.0 },
	{  1.0, -2.0,  1.0,  0.0 },
	{  1.0, -1.0,  0.0,  0.0 }
};

void checkTangents(const std::vector<Spline::Point>& tangents, std::size_t expected, const char* name) {
	if (tangents.empty()) {
		throw SplineError(SplineError::Code::MissingArgument, std::string(name) + " is required.");
	}
	if (tangents.size() != expected) {
		throw SplineError(SplineError::Code::LengthMismatch,
		                  std::string(name) + ".length must be equal to points.length - 1.");
	}
}

bool allFinite(const std::vector<Spline::Point>& v) {
	for (const auto& p : v) {
		if (!std::isfinite(p[0]) || !std::isfinite(p[1]) || !std::isfinite(p[2])) return false;
	}
	return true;
}
}

HermiteSpline::HermiteSpline(std::vector<double> times,
                             std::vector<Point> points,
                             std::vector<Point> inTangents,
                             std::vector<Point> outTangents)
	: Spline(std::move(times), std::move(points)),
	  inTangents_(std::move(inTangents)),
	  outTangents_(std::move(outTangents)) {
	checkTangents(inTangents_, numPoints() - 1, "inTangents");
	checkTangents(outTangents_, numPoints() - 1, "outTangents");
}

std::string HermiteSpline::typeName() const { return "hermite"; }

bool HermiteSpline::isValid(std::string* reason) const {
	if (!Spline::isValid(reason)) return false;
	if (!allFinite(inTangents_) || !allFinite(outTangents_)) {
		if (reason) *reason = "Tangents must be finite";
		return false;
	}
	return true;
}

const std::vector<Spline::Point>& HermiteSpline::inTangents() const { return inTangents_; }

const std::vector<Spline::Point>& HermiteSpline::outTangents() const { return outTangents_; }

std::array<double, 4> HermiteSpline::basisWeights(double u) {
	const double u2 = u * u;
	const double mono[4] = { u2 * u, u2, u, 1.0 };
	std::array<double, 4> h{};
	for (int r = 0; r < 4; ++r) {
		h[r] = kHermite[r][0] * mono[0] + kHermite[r][1] * mono[1] + kHermite[r][2] * mono[2] + kHermite[r][3] * mono[3];
	}
	return h;
}

Spline::Point HermiteSpline::blend(double u, const Point& p0, const Point& p1, const Point& m0, const Point& m1) {
	const std::array<double, 4> h = basisWeights(u);
	Point C{};
	for (int k = 0; k < 3; ++k) {
		C[k] = h[0] * p0[k] + h[1] * p1[k] + h[2] * m0[k] + h[3] * m1[k];
	}
	return C;
}

Spline::Point HermiteSpline::evaluateSegment(std::size_t i, double u) const {
	return blend(u, points()[i], points()[i + 1], outTangents_[i], inTangents_[i]);
}
