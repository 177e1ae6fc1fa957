#include "pillar/solar_time.hpp"

#include<cmath>
#include<string>

#include "pillar/errors.hpp"
#include "pillar/math.hpp"

Instant::Instant(double ts,double lon) : ts_(ts),lon_(lon){
	if(!std::isfinite(ts)){
		throw RangeError("timestamp is not finite");
	}
	if(!std::isfinite(lon)||lon<-180.0||lon>180.0){
		throw RangeError("longitude out of [-180,180]: "+std::to_string(lon));
	}
}

double infer_meridian(double lon){ return 15.0*std::round(lon/15.0); }

double AppTimeConv::app_sec(double ts,double lon) const{
	return ts+lon*MIN_PER_DEG*60.0+eot.minutes(ts)*60.0;
}

double AppTimeConv::midnight(long day_no,double lon) const{
	const double target=static_cast<double>(day_no)*SEC_DAY;
	double m=target-lon*MIN_PER_DEG*60.0;
	for(int i=0;i<max_iter;++i){
		double m_new=target-lon*MIN_PER_DEG*60.0-eot.minutes(m)*60.0;
		if(std::fabs(m_new-m)<tol_sec){
			return m_new;
		}
		m=m_new;
	}

	// app_sec is increasing, bisect on a two hour bracket
	double lo=m-3600.0;
	double hi=m+3600.0;
	if(app_sec(lo,lon)>target||app_sec(hi,lon)<target){
		throw ConvergenceError("apparent midnight not bracketed for day "+
							   std::to_string(day_no));
	}
	for(int i=0;i<max_iter;++i){
		double mid=0.5*(lo+hi);
		if(hi-lo<tol_sec){
			return mid;
		}
		if(app_sec(mid,lon)<target){
			lo=mid;
		}else{
			hi=mid;
		}
	}
	throw ConvergenceError("apparent midnight did not converge for day "+
						   std::to_string(day_no));
}

AppTime AppTimeConv::resolve(const Instant&at,double std_mer) const{
	AppTime out;
	out.ts=at.ts();
	out.lon=at.lon();
	out.std_mer=std_mer;

	double app=0.0;
	long n=0;
	double m=0.0;
	if(!solar){
		out.utc_off_min=std_mer*MIN_PER_DEG;
		app=at.ts()+out.utc_off_min*60.0;
		n=static_cast<long>(std::floor(app/SEC_DAY));
		m=static_cast<double>(n)*SEC_DAY-out.utc_off_min*60.0;
	}else{
		out.eot_min=eot.minutes(at.ts());
		out.offset_min=(at.lon()-std_mer)*MIN_PER_DEG+out.eot_min;
		out.utc_off_min=at.lon()*MIN_PER_DEG+out.eot_min;

		app=at.ts()+out.utc_off_min*60.0;
		n=static_cast<long>(std::floor(app/SEC_DAY));
		m=midnight(n,at.lon());
		if(at.ts()<m){
			--n;
			m=midnight(n,at.lon());
		}else{
			double m_next=midnight(n+1,at.lon());
			if(at.ts()>=m_next){
				++n;
				m=m_next;
			}
		}
	}

	out.day_no=n;
	out.day_start=m;
	double tod=(app-static_cast<double>(n)*SEC_DAY)/3600.0;
	if(tod<0.0){
		tod=0.0;
	}
	if(tod>=24.0){
		tod=std::nextafter(24.0,0.0);
	}
	out.tod_hours=tod;

	CivilDT d=CivilDT::from_unix(static_cast<double>(n)*SEC_DAY);
	out.year=d.year;
	out.month=d.month;
	out.day=d.day;
	return out;
}
