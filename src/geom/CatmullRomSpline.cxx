#include "CatmullRomSpline.hxx"
#include "HermiteSpline.hxx"

#include <cmath>
#include <utility>

static inline Spline::Point halfDiff(const Spline::Point& a, const Spline::Point& b) {
	return Spline::Point{ 0.5 * (a[0] - b[0]), 0.5 * (a[1] - b[1]), 0.5 * (a[2] - b[2]) };
}

static inline Spline::Point diff(const Spline::Point& a, const Spline::Point& b) {
	return Spline::Point{ a[0] - b[0], a[1] - b[1], a[2] - b[2] };
}

CatmullRomSpline::CatmullRomSpline(std::vector<double> times,
                                   std::vector<Point> points,
                                   std::optional<Point> firstTangent,
                                   std::optional<Point> lastTangent)
	: Spline(std::move(times), std::move(points)),
	  explicitFirst_(firstTangent.has_value()),
	  explicitLast_(lastTangent.has_value()) {
	const auto& P = this->points();
	const std::size_t n = P.size();
	tangents_.resize(n);
	for (std::size_t k = 1; k + 1 < n; ++k) tangents_[k] = halfDiff(P[k + 1], P[k - 1]);
	tangents_.front() = firstTangent ? *firstTangent : diff(P[1], P[0]);
	tangents_.back() = lastTangent ? *lastTangent : diff(P[n - 1], P[n - 2]);
}

std::string CatmullRomSpline::typeName() const { return "catmullrom"; }

bool CatmullRomSpline::isValid(std::string* reason) const {
	if (!Spline::isValid(reason)) return false;
	for (const auto& m : tangents_) {
		if (!std::isfinite(m[0]) || !std::isfinite(m[1]) || !std::isfinite(m[2])) {
			if (reason) *reason = "Tangents must be finite";
			return false;
		}
	}
	return true;
}

const Spline::Point& CatmullRomSpline::firstTangent() const { return tangents_.front(); }

const Spline::Point& CatmullRomSpline::lastTangent() const { return tangents_.back(); }

bool CatmullRomSpline::hasExplicitFirstTangent() const { return explicitFirst_; }

bool CatmullRomSpline::hasExplicitLastTangent() const { return explicitLast_; }

Spline::Point CatmullRomSpline::evaluateSegment(std::size_t i, double u) const {
	return HermiteSpline::blend(u, points()[i], points()[i + 1], tangents_[i], tangents_[i + 1]);
}
