#include "pillar/sun_lon.hpp"

#include<cmath>
#include<exception>
#include<limits>

#include "pillar/errors.hpp"
#include "pillar/math.hpp"
#include "pillar/time_scale.hpp"

double SunLonSrc::rate_at(double){
	return std::numeric_limits<double>::quiet_NaN();
}

double sun_lon_ok(SunLonSrc&src,double ts){
	double lon;
	try{
		lon=src.lon_at(ts);
	}catch(const PillarError&){
		throw;
	}catch(const std::exception&ex){
		throw ProviderFailure(src.name()+" provider failed: "+ex.what());
	}
	if(!std::isfinite(lon)){
		throw ProviderFailure(src.name()+" provider returned a non-finite "
										 "longitude");
	}
	return norm360(lon);
}

SunLonSample sample_sun(SunLonSrc&src,double ts){
	return {ts,sun_lon_ok(src,ts)};
}

double sun_rate_ok(SunLonSrc&src,double ts){
	try{
		return src.rate_at(ts);
	}catch(const PillarError&){
		throw;
	}catch(const std::exception&ex){
		throw ProviderFailure(src.name()+" provider rate failed: "+ex.what());
	}
}

namespace{

double cent_tt(double ts){
	return (TimeScale::unix_to_tdb(ts)-JD_J2000)/36525.0;
}

}

double SeriesSun::mean_lon(double T){
	return 280.46646+36000.76983*T+0.0003032*T*T;
}

double SeriesSun::mean_anom(double T){
	return 357.52911+35999.05029*T-0.0001537*T*T;
}

double SeriesSun::centre(double T,double*rate){
	double M=mean_anom(T)*DEG2RAD;
	double c1=1.914602-0.004817*T-0.000014*T*T;
	double c2=0.019993-0.000101*T;
	double c3=0.000289;
	if(rate){
		// dC/dT in degrees per century
		double dM=35999.05029*DEG2RAD;
		*rate=(c1*std::cos(M)+2.0*c2*std::cos(2.0*M)+3.0*c3*std::cos(3.0*M))*
			  dM;
	}
	return c1*std::sin(M)+c2*std::sin(2.0*M)+c3*std::sin(3.0*M);
}

double SeriesSun::lon_at(double ts){
	double T=cent_tt(ts);
	double om=(125.04-1934.136*T)*DEG2RAD;
	double lam=mean_lon(T)+centre(T)-0.00569-0.00478*std::sin(om);
	return norm360(lam);
}

double SeriesSun::rate_at(double ts){
	double T=cent_tt(ts);
	double dC=0.0;
	centre(T,&dC);
	return (36000.76983+0.0006064*T+dC)/36525.0;
}
