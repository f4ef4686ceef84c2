// Implementation for Spline base class
#include "Spline.hxx"
#include "SplineError.hxx"
#include "TimeInterval.hxx"

#include <cmath>
#include <utility>

Spline::Spline(std::vector<double> times, std::vector<Point> points)
	: times_(std::move(times)),
	  points_(std::move(points)) {
	if (times_.empty()) {
		throw SplineError(SplineError::Code::MissingArgument, "times is required.");
	}
	if (points_.empty()) {
		throw SplineError(SplineError::Code::MissingArgument, "points is required.");
	}
	if (points_.size() < 2) {
		throw SplineError(SplineError::Code::InvalidLength,
		                  "points.length must be greater than or equal to 2.");
	}
	if (times_.size() != points_.size()) {
		throw SplineError(SplineError::Code::LengthMismatch,
		                  "times.length must be equal to points.length.");
	}
}

Spline::~Spline() = default;

const std::vector<double>& Spline::times() const { return times_; }

const std::vector<Spline::Point>& Spline::points() const { return points_; }

std::size_t Spline::numPoints() const { return points_.size(); }

double Spline::tMin() const { return times_.front(); }

double Spline::tMax() const { return times_.back(); }

bool Spline::isValid(std::string* reason) const {
	for (std::size_t i = 0; i < times_.size(); ++i) {
		if (!std::isfinite(times_[i])) {
			if (reason) *reason = "Times must be finite";
			return false;
		}
		if (i > 0 && !(times_[i] > times_[i - 1])) {
			if (reason) *reason = "Times must be strictly increasing";
			return false;
		}
	}
	for (const auto& p : points_) {
		if (!std::isfinite(p[0]) || !std::isfinite(p[1]) || !std::isfinite(p[2])) {
			if (reason) *reason = "Points must be finite";
			return false;
		}
	}
	return true;
}

std::size_t Spline::findTimeInterval(double time, std::size_t startIndex) const {
	return ::findTimeInterval(time, startIndex, times_);
}

Spline::Point Spline::evaluate(double time) const {
	Point result{};
	evaluate(time, result);
	return result;
}

Spline::Point& Spline::evaluate(double time, Point& result) const {
	const std::size_t i = findTimeInterval(time, lastIndex_);
	lastIndex_ = i;
	const double u = (time - times_[i]) / (times_[i + 1] - times_[i]);
	result = evaluateSegment(i, u);
	return result;
}
