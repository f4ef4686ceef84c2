#include "BSpline.hxx"
#include "CatmullRomSpline.hxx"
#include "HermiteSpline.hxx"
#include "LinearSpline.hxx"
#include "SplIO.hxx"

#include <cmath>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

// Keyframes of a camera orbit: radius r around the z axis, rising from z0 to z1,
// one keyframe every (2*pi / perTurn) radians, one time unit apart.
static void makeOrbit(double r, double z0, double z1, int perTurn, int turns,
                      std::vector<double>& times, std::vector<Spline::Point>& points) {
	const double pi = 3.14159265358979323846;
	const int n = perTurn * turns;
	times.clear(); points.clear();
	for (int k = 0; k <= n; ++k) {
		double s = static_cast<double>(k) / n;
		double ang = 2.0 * pi * turns * s;
		times.push_back(static_cast<double>(k));
		points.push_back(Spline::Point{ r * std::cos(ang), r * std::sin(ang), z0 + (z1 - z0) * s });
	}
}

static bool writeOrDie(const std::string& path, const std::vector<std::unique_ptr<Spline>>& curves) {
	std::string err;
	if (!SplIO::writeFile(path, curves, &err)) {
		std::fprintf(stderr, "SPL write failed for %s: %s\n", path.c_str(), err.c_str());
		return false;
	}
	return true;
}

int main() {
	// Path 1: camera orbit, one copy per curve type
	{
		std::vector<double> T;
		std::vector<Spline::Point> P;
		makeOrbit(5.0, 1.0, 3.0, 8, 1, T, P);

		std::vector<std::unique_ptr<Spline>> curves;
		curves.push_back(std::make_unique<BSpline>(T, P));
		curves.push_back(std::make_unique<CatmullRomSpline>(T, P));
		curves.push_back(std::make_unique<LinearSpline>(T, P));
		if (!writeOrDie("camera_orbit.spl", curves)) return 1;
	}

	// Path 2: zig-zag with non-uniform keyframe spacing and explicit tangents
	{
		std::vector<double> T{ 0.0, 0.5, 2.0, 2.5, 4.0 };
		std::vector<Spline::Point> P{
			{ 0.0, 0.0, 0.0 }, { 1.0, 1.0, 0.0 }, { 2.0, 0.0, 0.5 }, { 3.0, 1.0, 0.5 }, { 4.0, 0.0, 1.0 }
		};
		// Hermite tangents: leave and arrive horizontally
		std::vector<Spline::Point> flat(P.size() - 1, Spline::Point{ 1.0, 0.0, 0.0 });

		std::vector<std::unique_ptr<Spline>> curves;
		curves.push_back(std::make_unique<BSpline>(T, P));
		curves.push_back(std::make_unique<CatmullRomSpline>(T, P, Spline::Point{ 0.0, 1.0, 0.0 }, Spline::Point{ 1.0, -1.0, 0.0 }));
		curves.push_back(std::make_unique<HermiteSpline>(T, P, flat, flat));
		if (!writeOrDie("zigzag.spl", curves)) return 1;
	}

	std::printf("Wrote example paths: camera_orbit.spl, zigzag.spl\n");
	return 0;
}
