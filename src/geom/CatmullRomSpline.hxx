#ifndef SPLINEPATH_CATMULL_ROM_SPLINE_HXX
#define SPLINEPATH_CATMULL_ROM_SPLINE_HXX

#include "Spline.hxx"

#include <optional>
#include <vector>

// Uniform Catmull-Rom curve: passes through every point.
// Tangent at interior point k is (points[k+1] - points[k-1]) / 2. End tangents
// default to the chord of the first/last segment unless given explicitly.
class CatmullRomSpline : public Spline {
public:
	CatmullRomSpline(std::vector<double> times,
	                 std::vector<Point> points,
	                 std::optional<Point> firstTangent = std::nullopt,
	                 std::optional<Point> lastTangent = std::nullopt);

	std::string typeName() const override;

	// Base checks plus finite tangents
	bool isValid(std::string* reason = nullptr) const override;

	// Tangents actually used at the first and last point
	const Point& firstTangent() const;
	const Point& lastTangent() const;

	// True if the end tangent was supplied rather than derived
	bool hasExplicitFirstTangent() const;
	bool hasExplicitLastTangent() const;

protected:
	Point evaluateSegment(std::size_t i, double u) const override;

private:
	std::vector<Point> tangents_; // one per point
	bool explicitFirst_{false};
	bool explicitLast_{false};
};

#endif // SPLINEPATH_CATMULL_ROM_SPLINE_HXX
