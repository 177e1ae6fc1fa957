#pragma once

#include<memory>
#include<string>

#include "pillar/frames.hpp"
#include "pillar/spc_ephem.hpp"
#include "pillar/sun_lon.hpp"

struct RetProp{
	Vec3 X;
	Vec3 V;
	double tr;
};

struct AberCorr{
	static double lightday(const Vec3&vec);

	// light-time corrected geocentric position and velocity
	static RetProp geo_prop(EphRead&eph,int target,double jd_tdb,
							int max_iter=3);

	// applies annual aberration to a geocentric direction
	static Vec3 aberrate(const Vec3&X,const Vec3&vE);
};

// Apparent solar longitude from an SPK kernel: light time, aberration,
// bias-precession-nutation, true ecliptic of date.
struct SpiceSun : SunLonSrc{
	explicit SpiceSun(const std::string&bsp_path);

	double lon_at(double ts) override;
	double rate_at(double ts) override;
	std::string name() const override{ return "spice"; }

	// radians and radians/day at a TDB Julian date
	std::pair<double,double> sun_calc(double jd_tdb);

  private:
	std::unique_ptr<EphRead> eph_;
	PrecNut pn_;
};
