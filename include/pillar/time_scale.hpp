#pragma once

#include "pillar/math.hpp"

struct TimeScale{
	static int leap_sec(double jd_utc);

	// TT-UT1 in seconds, Espenak-Meeus polynomials
	static double delta_t(double year);

	static double utc_to_tdb(double jd_utc);

	static double unix_to_tdb(double ts){ return utc_to_tdb(unix2jd(ts)); }
};
