// Implementation for BSpline class
#include "BSpline.hxx"

#include <utility>

namespace {
// Uniform cubic B-spline basis, rows map (u^3, u^2, u, 1) to one weight each
constexpr double kSixth = 1.0 / 6.0;
constexpr double kBasis[4][4] = {
	{ -1.0 * kSixth,  3.0 * kSixth, -3.0 * kSixth, 1.0 * kSixth },
	{  3.0 * kSixth, -6.0 * kSixth,  0.0 * kSixth, 4.0 * kSixth },
	{ -3.0 * kSixth,  3.0 * kSixth,  3.0 * kSixth, 1.0 * kSixth },
	{  1.0 * kSixth,  0.0 * kSixth,  0.0 * kSixth, 0.0 * kSixth }
};

// a + (a - b): b reflected through a
inline Spline::Point reflect(const Spline::Point& a, const Spline::Point& b) {
	return Spline::Point{ 2.0 * a[0] - b[0], 2.0 * a[1] - b[1], 2.0 * a[2] - b[2] };
}
}

BSpline::BSpline(std::vector<double> times, std::vector<Point> points)
	: Spline(std::move(times), std::move(points)) {}

std::string BSpline::typeName() const { return "bspline"; }

std::array<double, 4> BSpline::basisWeights(double u) {
	const double u2 = u * u;
	const double mono[4] = { u2 * u, u2, u, 1.0 };
	std::array<double, 4> w{};
	for (int r = 0; r < 4; ++r) {
		w[r] = kBasis[r][0] * mono[0] + kBasis[r][1] * mono[1] + kBasis[r][2] * mono[2] + kBasis[r][3] * mono[3];
	}
	return w;
}

BSpline::Window BSpline::windowKind(std::size_t i) const {
	const std::size_t last = numPoints() - 2;
	if (i == 0 && i == last) return Window::Single;
	if (i == 0) return Window::First;
	if (i == last) return Window::Last;
	return Window::Interior;
}

std::array<Spline::Point, 4> BSpline::controlWindow(std::size_t i) const {
	const auto& P = points();
	switch (windowKind(i)) {
		case Window::First:
			return { reflect(P[0], P[1]), P[0], P[1], P[2] };
		case Window::Last:
			return { P[i - 1], P[i], P[i + 1], reflect(P[i + 1], P[i]) };
		case Window::Single:
			// Two points: both neighbours are phantoms, giving the straight segment
			return { reflect(P[0], P[1]), P[0], P[1], reflect(P[1], P[0]) };
		case Window::Interior:
		default:
			return { P[i - 1], P[i], P[i + 1], P[i + 2] };
	}
}

Spline::Point BSpline::evaluateSegment(std::size_t i, double u) const {
	const std::array<double, 4> w = basisWeights(u);
	const std::array<Point, 4> cp = controlWindow(i);
	Point C{};
	for (int k = 0; k < 3; ++k) {
		C[k] = w[0] * cp[0][k] + w[1] * cp[1][k] + w[2] * cp[2][k] + w[3] * cp[3][k];
	}
	return C;
}
