#include "pillar/eot.hpp"

#include<cmath>
#include<string>

#include "pillar/errors.hpp"
#include "pillar/math.hpp"
#include "pillar/sun_lon.hpp"
#include "pillar/time_scale.hpp"

EotCorr::EotCorr(int ord,SunLonSrc*s) : order(ord),src(s){
	if(order<0||order>EOT_MAX_ORDER){
		throw RangeError("equation of time order out of [0,"+
						 std::to_string(EOT_MAX_ORDER)+"]: "+
						 std::to_string(order));
	}
	if(order==0&&src==nullptr){
		throw RangeError("equation of time order 0 needs a longitude source");
	}
}

bool EotCorr::in_window(double ts) const{
	if(!std::isnan(valid_from)&&ts<valid_from){
		return false;
	}
	if(!std::isnan(valid_to)&&ts>valid_to){
		return false;
	}
	return true;
}

double EotCorr::minutes(double ts) const{
	if(!std::isfinite(ts)){
		throw RangeError("instant is not finite");
	}
	if(!in_window(ts)){
		throw OutOfRange("instant outside the equation of time validity "
						 "window");
	}
	double T=(TimeScale::unix_to_tdb(ts)-JD_J2000)/36525.0;
	if(order==0){
		return from_src(ts,T);
	}
	return series(T);
}

double EotCorr::series(double T) const{
	double L0=SeriesSun::mean_lon(T)*DEG2RAD;
	double M=SeriesSun::mean_anom(T)*DEG2RAD;
	double e=0.016708634-0.000042037*T-0.0000001267*T*T;
	double eps=(23.4392911-0.0130042*T)*DEG2RAD;
	double y=std::tan(eps/2.0);
	y*=y;

	const double terms[EOT_MAX_ORDER]={
		y*std::sin(2.0*L0),
		-2.0*e*std::sin(M),
		4.0*e*y*std::sin(M)*std::cos(2.0*L0),
		-0.5*y*y*std::sin(4.0*L0),
		-1.25*e*e*std::sin(2.0*M),
	};
	double E=0.0;
	for(int i=0;i<order;++i){
		E+=terms[i];
	}
	return E*RAD2DEG*MIN_PER_DEG;
}

double EotCorr::from_src(double ts,double T) const{
	double lam=sun_lon_ok(*src,ts)*DEG2RAD;
	double eps=(23.4392911-0.0130042*T)*DEG2RAD;
	double alpha=std::atan2(std::cos(eps)*std::sin(lam),std::cos(lam))*
				 RAD2DEG;
	double E=norm180(SeriesSun::mean_lon(T)-0.0057183-alpha);
	return E*MIN_PER_DEG;
}
