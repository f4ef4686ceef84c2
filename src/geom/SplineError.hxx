#ifndef SPLINEPATH_SPLINE_ERROR_HXX
#define SPLINEPATH_SPLINE_ERROR_HXX

#include <stdexcept>
#include <string>

// Error raised by spline construction and evaluation.
// code() tells callers which contract was violated without parsing what().
class SplineError : public std::runtime_error {
public:
    enum class Code {
        MissingArgument, // required input absent (empty sequence)
        InvalidLength,   // fewer than 2 control points
        LengthMismatch,  // parallel arrays disagree in length
        OutOfRange       // query time outside [times.front(), times.back()]
    };

    SplineError(Code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    Code code() const noexcept { return code_; }

private:
    Code code_;
};

#endif // SPLINEPATH_SPLINE_ERROR_HXX
