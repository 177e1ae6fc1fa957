#pragma once

#include<string>

// Source of the Sun's apparent geocentric ecliptic longitude.
struct SunLonSrc{
	virtual ~SunLonSrc()=default;

	// degrees, any real value is accepted and normalized by the caller
	virtual double lon_at(double ts)=0;

	// degrees per day; NaN when the source cannot supply a rate
	virtual double rate_at(double ts);

	virtual std::string name() const=0;
};

struct SunLonSample{
	double ts;
	double lon;
};

// Provider calls go through these: failures and non-finite values become
// ProviderFailure, longitudes come back in [0,360).
double sun_lon_ok(SunLonSrc&src,double ts);

SunLonSample sample_sun(SunLonSrc&src,double ts);

double sun_rate_ok(SunLonSrc&src,double ts);

// Meeus low-accuracy solar theory, about 0.01 deg.
struct SeriesSun : SunLonSrc{
	double lon_at(double ts) override;
	double rate_at(double ts) override;
	std::string name() const override{ return "series"; }

	// Mean longitude and mean anomaly (degrees) at Julian centuries T (TT).
	static double mean_lon(double T);
	static double mean_anom(double T);
	static double centre(double T,double*rate=nullptr);
};
