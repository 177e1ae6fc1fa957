#pragma once

#include<array>
#include<iosfwd>
#include<limits>
#include<memory>
#include<optional>
#include<string>
#include<vector>

#include "pillar/cycle.hpp"
#include "pillar/errors.hpp"
#include "pillar/solar_time.hpp"
#include "pillar/sterm.hpp"

enum class YearRule{ LON,DATE };

// Where the year pillar turns over: a solar longitude, or a civil date
// (local standard clock at the standard meridian).
struct YearPolicy{
	YearRule rule=YearRule::LON;
	double lon=315.0;
	int month=2;
	int day=4;
};

// Day and year pillar values known at a reference. ts is the Unix time of
// the start of the reference day (its local date is what counts).
struct RefEpoch{
	double ts=-2208988800.0;
	int day_val=10;
	int year_no=1900;
	int year_val=36;
};

struct PillarCfg{
	// NaN: infer from the longitude
	double std_mer=std::numeric_limits<double>::quiet_NaN();
	// false: mean time at std_mer, no longitude or EoT correction
	bool solar_corr=true;
	YearPolicy year_pol;
	int eot_order=5;
	double root_tol=1e-6;
	int root_iter=50;
	double term_margin=20.0;
	double scan_step=2.0;
	RefEpoch ref;
	double jie_origin=315.0;
	int jie_branch=2;
	// first month stem, indexed by year stem mod 5
	std::array<int,5> month_stems{{2,4,6,8,0}};
	// Zi hour stem, indexed by day stem mod 5
	std::array<int,5> hour_stems{{0,2,4,6,8}};
	double eot_from=std::numeric_limits<double>::quiet_NaN();
	double eot_to=std::numeric_limits<double>::quiet_NaN();

	void validate() const;

	RootOpt root_opt() const;
};

struct CoordSet{
	SexaUnit year;
	SexaUnit month;
	SexaUnit day;
	SexaUnit hour;

	Instant at;
	AppTime app;
	// apparent minus mean clock time, minutes
	double offset_min;

	int pillar_year;
	// sectional months since the configured origin, 0..11
	int month_ord;
	double month_start;
	double year_start;

	bool same_pillars(const CoordSet&b) const;
};

struct ConvItem{
	std::optional<CoordSet> coord;
	ErrKind kind=ErrKind::NONE;
	std::string error;

	bool ok() const{ return coord.has_value(); }
};

// Four-pillar coordinates from instants. convert() may be called from
// several threads at once as long as the SunLonSrc tolerates it.
struct PillarCal{
	SunLonSrc&src;
	PillarCfg cfg;
	std::shared_ptr<TermCache> cache;
	EotCorr eot;
	AppTimeConv atc;
	SolTerms terms;
	std::ostream*log=nullptr;

	PillarCal(SunLonSrc&s,const PillarCfg&c,
			  std::shared_ptr<TermCache> shared=nullptr);

	PillarCal(const PillarCal&)=delete;
	PillarCal&operator=(const PillarCal&)=delete;

	CoordSet convert(double ts,double lon);

	std::vector<ConvItem> conv_batch(const std::vector<double>&ts,double lon,
									 int jobs=1);

	double meridian_for(double lon) const;

	// pillar year governing ts and the instant it began
	std::pair<int,double> year_of(double ts,double std_mer);

	// ordinal of the governing sectional term and its instant
	std::pair<int,double> month_of(double ts);

	SexaUnit year_unit(int pillar_year) const;
	SexaUnit month_unit(const SexaUnit&year,int ord) const;
	SexaUnit day_unit(long day_no) const;
	SexaUnit hour_unit(const SexaUnit&day,double tod_hours) const;

	static int hour_slot(double tod_hours);

  private:
	TermNode jie_node(int ord,double near_ts);
};
