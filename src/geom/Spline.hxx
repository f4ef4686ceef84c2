#ifndef SPLINEPATH_SPLINE_HXX
#define SPLINEPATH_SPLINE_HXX

#include <array>
#include <cstddef>
#include <string>
#include <vector>

// Common base for time-parameterized curves through 3D points.
// Notes:
// - times and points are parallel arrays; times[k] is the parameter of points[k].
// - times must be strictly increasing. The constructor does not check this;
//   isValid() reports it.
// - Construction throws SplineError: MissingArgument if either array is empty,
//   InvalidLength if fewer than 2 points, LengthMismatch if the sizes differ.
// - evaluate() keeps the last interval index as a search hint. It is const but
//   writes that hint, so one instance must not be evaluated from two threads at once.
class Spline {
public:
	using Point = std::array<double, 3>; // 3D point (x, y, z)

	Spline(std::vector<double> times, std::vector<Point> points);
	virtual ~Spline();

	// Keyword used by the .spl file format ("bspline", "linear", ...)
	virtual std::string typeName() const = 0;

	// Accessors
	const std::vector<double>& times() const;
	const std::vector<Point>& points() const;
	std::size_t numPoints() const;

	// Parameter domain [tMin, tMax] where evaluation is defined
	double tMin() const;
	double tMax() const;

	// Finite, strictly increasing times and finite points. Derived curves add their own data.
	virtual bool isValid(std::string* reason = nullptr) const;

	// Index i with times[i] <= time <= times[i+1], searching from startIndex.
	// Throws SplineError (OutOfRange) if time is outside [tMin, tMax].
	std::size_t findTimeInterval(double time, std::size_t startIndex = 0) const;

	// Evaluate the curve at time. The second form writes into result and returns it.
	// Throws SplineError (OutOfRange) if time is outside [tMin, tMax].
	Point evaluate(double time) const;
	Point& evaluate(double time, Point& result) const;

protected:
	// Copy and move only through a derived type
	Spline(const Spline&) = default;
	Spline& operator=(const Spline&) = default;
	Spline(Spline&&) = default;
	Spline& operator=(Spline&&) = default;

	// Evaluate on interval i (times[i] <= time <= times[i+1]) with local parameter u in [0,1]
	virtual Point evaluateSegment(std::size_t i, double u) const = 0;

private:
	std::vector<double> times_;
	std::vector<Point> points_;
	mutable std::size_t lastIndex_{0};
};

#endif // SPLINEPATH_SPLINE_HXX
