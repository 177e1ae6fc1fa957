#pragma once

#include "pillar/eot.hpp"

// A point in time (Unix seconds, UTC) seen from a geographic longitude.
class Instant{
  public:
	Instant(double ts,double lon);

	double ts() const{ return ts_; }
	double lon() const{ return lon_; }

  private:
	double ts_;
	double lon_;
};

// meridian of the zone a longitude falls in, multiple of 15
double infer_meridian(double lon);

struct AppTime{
	double ts=0.0;
	double lon=0.0;
	double std_mer=0.0;
	double eot_min=0.0;
	// apparent minus mean clock time at std_mer
	double offset_min=0.0;
	// apparent minus UTC, lon*4 + eot
	double utc_off_min=0.0;
	double tod_hours=0.0;
	// apparent days since 1970-01-01
	long day_no=0;
	// Unix time of the apparent midnight that opened day_no
	double day_start=0.0;
	int year=1970;
	int month=1;
	int day=1;
};

struct AppTimeConv{
	const EotCorr&eot;
	double tol_sec=1e-3;
	int max_iter=50;
	// false: days and hours follow the standard clock at std_mer
	bool solar=true;

	explicit AppTimeConv(const EotCorr&e) : eot(e){}

	// apparent local seconds since the epoch
	double app_sec(double ts,double lon) const;

	// instant at which apparent time at lon reads 00:00 of day_no
	double midnight(long day_no,double lon) const;

	AppTime resolve(const Instant&at,double std_mer) const;
};
