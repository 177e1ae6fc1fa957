#include<gtest/gtest.h>

#include<algorithm>
#include<cmath>
#include<limits>
#include<memory>

#include "mock_sun.hpp"
#include "pillar/eot.hpp"
#include "pillar/errors.hpp"
#include "pillar/math.hpp"
#include "pillar/solar_time.hpp"
#include "pillar/time_scale.hpp"

namespace{

struct Extrema{
	double lo=1e9;
	double hi=-1e9;
	double t_lo=0.0;
	double t_hi=0.0;
};

Extrema scan_year(const EotCorr&e,int year){
	Extrema x;
	double t0=unix_of(year,1,1);
	double t1=unix_of(year+1,1,1);
	for(double t=t0;t<t1;t+=SEC_DAY/4.0){
		double m=e.minutes(t);
		if(m<x.lo){
			x.lo=m;
			x.t_lo=t;
		}
		if(m>x.hi){
			x.hi=m;
			x.t_hi=t;
		}
	}
	return x;
}

}

TEST(EotCorr,PeriodicOverTropicalYear){
	EotCorr e(5);
	for(int k=0;k<40;++k){
		double t=unix_of(2020,1,1)+k*9.1*SEC_DAY;
		EXPECT_NEAR(e.minutes(t),e.minutes(t+YEAR_SEC),0.01)<<"sample "<<k;
	}
}

TEST(EotCorr,ContinuousAcrossNewYear){
	EotCorr e(5);
	double t=unix_of(2024,1,1);
	EXPECT_NEAR(e.minutes(t-1.0),e.minutes(t),1e-3);
}

TEST(EotCorr,ExtremaInEarlyNovemberAndFebruary){
	for(int year : {1950,2000,2024,2050}){
		Extrema x=scan_year(EotCorr(5),year);
		EXPECT_GT(x.hi,15.5)<<year;
		EXPECT_LT(x.hi,17.0)<<year;
		EXPECT_LT(x.lo,-13.5)<<year;
		EXPECT_GT(x.lo,-15.0)<<year;
		EXPECT_EQ(CivilDT::from_unix(x.t_hi).month,11)<<year;
		EXPECT_EQ(CivilDT::from_unix(x.t_lo).month,2)<<year;
	}
}

TEST(EotCorr,LowerOrdersApproximateFullSeries){
	EotCorr full(5);
	EotCorr two(2);
	EotCorr one(1);
	double worst_two=0.0;
	double worst_one=0.0;
	double t0=unix_of(2024,1,1);
	for(int d=0;d<366;d+=3){
		double t=t0+d*SEC_DAY;
		worst_two=std::max(worst_two,std::fabs(two.minutes(t)-full.minutes(t)));
		worst_one=std::max(worst_one,std::fabs(one.minutes(t)-full.minutes(t)));
	}
	EXPECT_LT(worst_two,1.0);
	EXPECT_GT(worst_one,5.0);
}

TEST(EotCorr,ProviderModeAgreesWithSeries){
	SeriesSun sun;
	EotCorr src_mode(0,&sun);
	EotCorr series(5);
	double t0=unix_of(2024,1,1);
	for(int d=0;d<366;d+=5){
		double t=t0+d*SEC_DAY;
		EXPECT_NEAR(src_mode.minutes(t),series.minutes(t),0.3)<<"day "<<d;
	}
}

TEST(EotCorr,RejectsBadOrder){
	EXPECT_THROW(EotCorr(-1),RangeError);
	EXPECT_THROW(EotCorr(6),RangeError);
	EXPECT_THROW(EotCorr(0),RangeError);
	SeriesSun sun;
	EXPECT_NO_THROW(EotCorr(0,&sun));
}

TEST(EotCorr,ValidityWindow){
	EotCorr e(5);
	e.valid_from=unix_of(1900,1,1);
	e.valid_to=unix_of(2100,1,1);
	EXPECT_NO_THROW(e.minutes(unix_of(2000,6,1)));
	EXPECT_THROW(e.minutes(unix_of(1800,6,1)),OutOfRange);
	EXPECT_THROW(e.minutes(unix_of(2200,6,1)),OutOfRange);

	EotCorr open(5);
	EXPECT_NO_THROW(open.minutes(unix_of(1000,6,1)));
}

TEST(EotCorr,NonFiniteInstant){
	EotCorr e(5);
	EXPECT_THROW(e.minutes(std::numeric_limits<double>::quiet_NaN()),
				 RangeError);
	EXPECT_THROW(e.minutes(std::numeric_limits<double>::infinity()),
				 RangeError);
}

TEST(EotCorr,ProviderFailureSurfaces){
	ThrowSun bad;
	EotCorr e(0,&bad);
	EXPECT_THROW(e.minutes(0.0),ProviderFailure);
	NanSun nan;
	EotCorr f(0,&nan);
	EXPECT_THROW(f.minutes(0.0),ProviderFailure);
}

TEST(AppTimeConv,ApparentMidnightReadsZero){
	EotCorr e(5);
	AppTimeConv atc(e);
	long day_no=static_cast<long>(std::floor(unix_of(2024,11,3)/SEC_DAY));
	for(double lon : {-122.4,0.0,116.4,179.0}){
		double m=atc.midnight(day_no,lon);
		EXPECT_NEAR(atc.app_sec(m,lon),day_no*SEC_DAY,0.01)<<lon;

		AppTime before=atc.resolve(Instant(m-1.0,lon),infer_meridian(lon));
		AppTime after=atc.resolve(Instant(m+1.0,lon),infer_meridian(lon));
		EXPECT_EQ(before.day_no,day_no-1)<<lon;
		EXPECT_EQ(after.day_no,day_no)<<lon;
		EXPECT_NEAR(after.day_start,m,0.01)<<lon;
		EXPECT_LT(after.tod_hours,0.01)<<lon;
		EXPECT_GT(before.tod_hours,23.99)<<lon;
	}
}

TEST(AppTimeConv,ApparentMidnightOffsetFromMeanMidnight){
	EotCorr e(5);
	AppTimeConv atc(e);
	// early November the Sun runs about 16 minutes fast
	long day_no=static_cast<long>(std::floor(unix_of(2024,11,3)/SEC_DAY));
	double m=atc.midnight(day_no,0.0);
	EXPECT_NEAR((day_no*SEC_DAY-m)/60.0,16.4,0.3);
}

TEST(AppTimeConv,OffsetFollowsLongitude){
	EotCorr e(5);
	AppTimeConv atc(e);
	double t=unix_of(2024,6,1,3,0);
	AppTime a=atc.resolve(Instant(t,105.0),120.0);
	AppTime b=atc.resolve(Instant(t,120.0),120.0);
	EXPECT_NEAR(b.offset_min-a.offset_min,60.0,1e-9);
	EXPECT_NEAR(b.offset_min,b.eot_min,1e-12);
}

TEST(Instant,RejectsBadInput){
	EXPECT_THROW(Instant(0.0,180.5),RangeError);
	EXPECT_THROW(Instant(0.0,-181.0),RangeError);
	EXPECT_THROW(Instant(std::nan(""),0.0),RangeError);
	EXPECT_NO_THROW(Instant(0.0,-180.0));
	EXPECT_DOUBLE_EQ(infer_meridian(116.4),120.0);
	EXPECT_DOUBLE_EQ(infer_meridian(-122.4),-120.0);
}

TEST(TimeScale,LeapSecondEra){
	double jd=unix2jd(unix_of(2024,1,1));
	EXPECT_EQ(TimeScale::leap_sec(jd),37);
	EXPECT_EQ(TimeScale::leap_sec(unix2jd(unix_of(1970,1,1))),0);
	// TT-UTC = 37 + 32.184 s
	EXPECT_NEAR((TimeScale::utc_to_tdb(jd)-jd)*SEC_DAY,69.184,1e-4);
	double ts=unix_of(2024,6,1,12,0);
	EXPECT_NEAR((TimeScale::unix_to_tdb(ts)-unix2jd(ts))*SEC_DAY,69.184,1e-4);
}

TEST(TimeScale,DeltaTOutsideLeapEra){
	EXPECT_NEAR(TimeScale::delta_t(1900.0),-2.8,0.5);
	EXPECT_NEAR(TimeScale::delta_t(1950.0),29.1,1.0);
	EXPECT_GT(TimeScale::delta_t(1000.0),1000.0);
	double jd=unix2jd(unix_of(1949,10,1));
	EXPECT_NEAR((TimeScale::utc_to_tdb(jd)-jd)*SEC_DAY,
				TimeScale::delta_t(1949.75),0.01);
}

TEST(SunLonGuard,NormalizesAndWraps){
	LinearSun sun(0.0);
	SunLonSample s=sample_sun(sun,-YEAR_SEC/4.0);
	EXPECT_NEAR(s.lon,270.0,1e-9);
	EXPECT_DOUBLE_EQ(s.ts,-YEAR_SEC/4.0);
	EXPECT_THROW(sun_lon_ok(*std::make_unique<ThrowSun>(),0.0),
				 ProviderFailure);
	WobbleSun w(0.0,1.0,10.0);
	EXPECT_TRUE(std::isnan(sun_rate_ok(w,0.0)));
}

TEST(SunLonGuard,SeriesSunMatchesKnownLongitude){
	SeriesSun sun;
	// Meeus example 25.a: 1992-10-13 0h TD, apparent longitude 199.90895
	double ts=unix_of(1992,10,13)-59.0;
	EXPECT_NEAR(sun_lon_ok(sun,ts),199.909,0.01);
	double rate=sun_rate_ok(sun,ts);
	EXPECT_NEAR(rate,0.99,0.03);
}
