#ifndef SPLINEPATH_BSPLINE_HXX
#define SPLINEPATH_BSPLINE_HXX

#include "Spline.hxx"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// Uniform cubic B-spline through time-indexed 3D control points.
// Notes:
// - Each interval [times[i], times[i+1]] is blended from the four points
//   framing it with the fixed uniform B-spline basis matrix.
// - The curve approximates interior points and passes through the first and last.
// - At the two boundary intervals the missing neighbour is synthesized by
//   reflecting the adjacent point, so callers supply only real points.
class BSpline : public Spline {
public:
	// Which four-point window an interval uses
	enum class Window { First, Interior, Last, Single };

	BSpline(std::vector<double> times, std::vector<Point> points);

	std::string typeName() const override;

	// Blending weights (w0, w1, w2, w3) for local parameter u in [0,1]; they sum to 1
	static std::array<double, 4> basisWeights(double u);

	// Window kind for interval i (i in [0, numPoints()-2])
	Window windowKind(std::size_t i) const;

	// The four control points blended on interval i, phantom points included
	std::array<Point, 4> controlWindow(std::size_t i) const;

protected:
	Point evaluateSegment(std::size_t i, double u) const override;
};

#endif // SPLINEPATH_BSPLINE_HXX
