#ifndef SPLINEPATH_TIME_INTERVAL_HXX
#define SPLINEPATH_TIME_INTERVAL_HXX

#include <cstddef>
#include <vector>

// Find index i such that times[i] <= time <= times[i+1].
// - times must hold at least 2 strictly increasing values.
// - hint is the result of a previous call; the intervals at and next to it are
//   checked first, so sequential queries cost O(1). Any hint value is accepted.
// - Returns the largest i with times[i] <= time, capped at times.size() - 2.
// Throws SplineError (OutOfRange) if time lies outside [times.front(), times.back()].
std::size_t findTimeInterval(double time, std::size_t hint, const std::vector<double>& times);

#endif // SPLINEPATH_TIME_INTERVAL_HXX
