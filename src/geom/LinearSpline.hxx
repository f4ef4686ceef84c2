#ifndef SPLINEPATH_LINEAR_SPLINE_HXX
#define SPLINEPATH_LINEAR_SPLINE_HXX

#include "Spline.hxx"

// Piecewise linear curve through time-indexed points.
class LinearSpline : public Spline {
public:
	LinearSpline(std::vector<double> times, std::vector<Point> points);

	std::string typeName() const override;

protected:
	Point evaluateSegment(std::size_t i, double u) const override;
};

#endif // SPLINEPATH_LINEAR_SPLINE_HXX
