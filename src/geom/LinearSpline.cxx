#include "LinearSpline.hxx"

#include <utility>

LinearSpline::LinearSpline(std::vector<double> times, std::vector<Point> points)
	: Spline(std::move(times), std::move(points)) {}

std::string LinearSpline::typeName() const { return "linear"; }

Spline::Point LinearSpline::evaluateSegment(std::size_t i, double u) const {
	const Point& a = points()[i];
	const Point& b = points()[i + 1];
	return Point{ a[0] + u * (b[0] - a[0]), a[1] + u * (b[1] - a[1]), a[2] + u * (b[2] - a[2]) };
}
