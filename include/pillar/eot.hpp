#pragma once

#include<cmath>
#include<limits>

struct SunLonSrc;

constexpr int EOT_MAX_ORDER=5;

// Apparent minus mean solar time, in minutes.
//
// order 1..5 keeps that many terms of Smart's series
//   E = y sin2L0 - 2e sinM + 4ey sinM cos2L0 - y^2/2 sin4L0 - 5/4 e^2 sin2M
// order 0 takes the Sun's right ascension from a SunLonSrc instead:
//   E = L0 - 0.0057183 - alpha
struct EotCorr{
	int order=EOT_MAX_ORDER;
	SunLonSrc*src=nullptr;

	// optional validity window in Unix seconds, NaN = open
	double valid_from=std::numeric_limits<double>::quiet_NaN();
	double valid_to=std::numeric_limits<double>::quiet_NaN();

	EotCorr()=default;
	explicit EotCorr(int ord,SunLonSrc*s=nullptr);

	double minutes(double ts) const;

	double series(double T) const;

	double from_src(double ts,double T) const;

	bool in_window(double ts) const;
};
