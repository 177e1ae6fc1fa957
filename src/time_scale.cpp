#include "pillar/time_scale.hpp"

#include<cmath>

namespace{

constexpr double TT_TAI=32.184;

double dec_year(double jd){ return 2000.0+(jd-JD_J2000)/365.2425; }

bool in_leap_era(double year){ return year>=1972.0&&year<2027.0; }

}

int TimeScale::leap_sec(double jd_utc){
	struct Entry{
		double jd;
		int leaps;
	};
	static const Entry table[]={
		{2441317.5,10},{2441499.5,11},{2441683.5,12},{2442048.5,13},
		{2442413.5,14},{2442778.5,15},{2443144.5,16},{2443509.5,17},
		{2443874.5,18},{2444239.5,19},{2444786.5,20},{2445151.5,21},
		{2445516.5,22},{2446247.5,23},{2447161.5,24},{2447892.5,25},
		{2448257.5,26},{2448804.5,27},{2449169.5,28},{2449534.5,29},
		{2450083.5,30},{2450630.5,31},{2451179.5,32},{2453736.5,33},
		{2454832.5,34},{2456109.5,35},{2457204.5,36},{2457754.5,37},
	};
	int leaps=0;
	for(const auto&e : table){
		if(jd_utc>=e.jd){
			leaps=e.leaps;
		}else{
			break;
		}
	}
	return leaps;
}

double TimeScale::delta_t(double y){
	double t;
	if(y<-500.0){
		t=(y-1820.0)/100.0;
		return -20.0+32.0*t*t;
	}
	if(y<500.0){
		t=y/100.0;
		return 10583.6-1014.41*t+33.78311*t*t-5.952053*t*t*t-
			   0.1798452*std::pow(t,4)+0.022174192*std::pow(t,5)+
			   0.0090316521*std::pow(t,6);
	}
	if(y<1600.0){
		t=(y-1000.0)/100.0;
		return 1574.2-556.01*t+71.23472*t*t+0.319781*t*t*t-
			   0.8503463*std::pow(t,4)-0.005050998*std::pow(t,5)+
			   0.0083572073*std::pow(t,6);
	}
	if(y<1700.0){
		t=y-1600.0;
		return 120.0-0.9808*t-0.01532*t*t+t*t*t/7129.0;
	}
	if(y<1800.0){
		t=y-1700.0;
		return 8.83+0.1603*t-0.0059285*t*t+0.00013336*t*t*t-
			   std::pow(t,4)/1174000.0;
	}
	if(y<1860.0){
		t=y-1800.0;
		return 13.72-0.332447*t+0.0068612*t*t+0.0041116*t*t*t-
			   0.00037436*std::pow(t,4)+0.0000121272*std::pow(t,5)-
			   0.0000001699*std::pow(t,6)+0.000000000875*std::pow(t,7);
	}
	if(y<1900.0){
		t=y-1860.0;
		return 7.62+0.5737*t-0.251754*t*t+0.01680668*t*t*t-
			   0.0004473624*std::pow(t,4)+std::pow(t,5)/233174.0;
	}
	if(y<1920.0){
		t=y-1900.0;
		return -2.79+1.494119*t-0.0598939*t*t+0.0061966*t*t*t-
			   0.000197*std::pow(t,4);
	}
	if(y<1941.0){
		t=y-1920.0;
		return 21.20+0.84493*t-0.076100*t*t+0.0020936*t*t*t;
	}
	if(y<1961.0){
		t=y-1950.0;
		return 29.07+0.407*t-t*t/233.0+t*t*t/2547.0;
	}
	if(y<1986.0){
		t=y-1975.0;
		return 45.45+1.067*t-t*t/260.0-t*t*t/718.0;
	}
	if(y<2005.0){
		t=y-2000.0;
		return 63.86+0.3345*t-0.060374*t*t+0.0017275*t*t*t+
			   0.000651814*std::pow(t,4)+0.00002373599*std::pow(t,5);
	}
	if(y<2050.0){
		t=y-2000.0;
		return 62.92+0.32217*t+0.005589*t*t;
	}
	if(y<2150.0){
		double u=(y-1820.0)/100.0;
		return -20.0+32.0*u*u-0.5628*(2150.0-y);
	}
	double u=(y-1820.0)/100.0;
	return -20.0+32.0*u*u;
}

double TimeScale::utc_to_tdb(double jd_utc){
	double year=dec_year(jd_utc);
	if(!in_leap_era(year)){
		return jd_utc+delta_t(year)/SEC_DAY;
	}
	int leaps=leap_sec(jd_utc);
	return jd_utc+(static_cast<double>(leaps)+TT_TAI)/SEC_DAY;
}
