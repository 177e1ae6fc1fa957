#pragma once

#include<utility>

#include "pillar/math.hpp"

enum class PrecModel{ AUTO,IAU2006,VONDRAK };

struct CoordTf{
	static Mat3 R1(double angle);
};

// Precession-nutation through ERFA. AUTO switches to the Vondrak long-term
// precession once the epoch is more than long_thr years from J2000.
struct PrecNut{
	PrecModel model=PrecModel::AUTO;
	double long_thr=200.0;

	// GCRS -> true equator and equinox of date
	Mat3 bpn_mat(double jd_tdb) const;

	static double mean_obl(double jd_tdb);

	// dpsi, deps in radians
	static std::pair<double,double> nut_ang(double jd_tdb);

	static double true_obl(double jd_tdb);
};
