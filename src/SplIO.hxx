#ifndef SPL_IO_HXX
#define SPL_IO_HXX

#include "Spline.hxx"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace SplIO {

// Read a .spl file and append curves to 'out'. Returns false if the file cannot be opened;
// throws on malformed content (SplineError for construction failures).
bool readFile(const std::string& path, std::vector<std::unique_ptr<Spline>>& out);
bool readFile(const std::string& path, std::vector<std::unique_ptr<Spline>>& out, std::string* errorMessage);

// Write curves to a .spl file with full double precision. Returns true on success.
bool writeFile(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves);
bool writeFile(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves, std::string* errorMessage);

// Write PathSampler::sample rows of every curve as CSV with the header
// "curve,type,time,x,y,z" (curve is the index in 'curves'). The stream form returns the
// stream state; the file form also fails if the file cannot be opened or closed.
// Throws std::invalid_argument if samplesPerInterval < 1.
bool writeSamplesCsv(std::ostream& os, const std::vector<std::unique_ptr<Spline>>& curves, int samplesPerInterval);
bool writeSamplesCsv(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves,
                     int samplesPerInterval, std::string* errorMessage = nullptr);

// Build a curve of the named type ("bspline", "linear", "catmullrom", "hermite").
// Throws std::runtime_error for an unknown type.
std::unique_ptr<Spline> makeSpline(const std::string& type,
                                   std::vector<double> times,
                                   std::vector<Spline::Point> points);

} // namespace SplIO

#endif // SPL_IO_HXX
