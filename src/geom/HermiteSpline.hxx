#ifndef SPLINEPATH_HERMITE_SPLINE_HXX
#define SPLINEPATH_HERMITE_SPLINE_HXX

#include "Spline.hxx"

#include <array>
#include <vector>

// Cubic Hermite curve with caller-supplied tangents.
// Notes:
// - Segment i runs from points[i] to points[i+1], leaving with outTangents[i]
//   and arriving with inTangents[i]. Both arrays have numPoints() - 1 entries.
// - Tangents are expressed per unit of the local parameter u, not per unit time.
// - Throws SplineError: MissingArgument if a tangent array is empty,
//   LengthMismatch if its size is not numPoints() - 1.
class HermiteSpline : public Spline {
public:
	HermiteSpline(std::vector<double> times,
	              std::vector<Point> points,
	              std::vector<Point> inTangents,
	              std::vector<Point> outTangents);

	std::string typeName() const override;

	// Base checks plus finite tangents
	bool isValid(std::string* reason = nullptr) const override;

	const std::vector<Point>& inTangents() const;
	const std::vector<Point>& outTangents() const;

	// Hermite weights (h00, h01, h10, h11) for u in [0,1]: start point, end point,
	// start tangent, end tangent
	static std::array<double, 4> basisWeights(double u);

	// Blend one Hermite segment
	static Point blend(double u, const Point& p0, const Point& p1, const Point& m0, const Point& m1);

protected:
	Point evaluateSegment(std::size_t i, double u) const override;

private:
	std::vector<Point> inTangents_;
	std::vector<Point> outTangents_;
};

#endif // SPLINEPATH_HERMITE_SPLINE_HXX
