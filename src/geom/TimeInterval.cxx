#include "TimeInterval.hxx"
#include "SplineError.hxx"

#include <algorithm>
#include <string>

std::size_t findTimeInterval(double time, std::size_t hint, const std::vector<double>& times) {
	if (times.empty()) {
		throw SplineError(SplineError::Code::MissingArgument, "times is required");
	}
	if (times.size() < 2) {
		throw SplineError(SplineError::Code::InvalidLength, "times must hold at least 2 values");
	}
	// Written as a negated range test so NaN is rejected too
	if (!(time >= times.front() && time <= times.back())) {
		throw SplineError(SplineError::Code::OutOfRange,
		                  "time " + std::to_string(time) + " outside [" + std::to_string(times.front()) +
		                  ", " + std::to_string(times.back()) + "]");
	}

	const std::size_t last = times.size() - 2;
	auto contains = [&](std::size_t i) {
		return times[i] <= time && (i == last || time < times[i + 1]);
	};

	if (hint > last) hint = last;
	if (contains(hint)) return hint;
	if (hint < last && contains(hint + 1)) return hint + 1;
	if (hint > 0 && contains(hint - 1)) return hint - 1;

	// Hint missed by more than one interval: binary search for the last knot <= time
	auto it = std::upper_bound(times.begin(), times.end(), time);
	const std::size_t i = static_cast<std::size_t>(it - times.begin()) - 1;
	return std::min(i, last);
}
