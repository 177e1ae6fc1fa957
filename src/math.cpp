#include "pillar/math.hpp"

#include<cmath>

double norm360(double deg){
	double r=std::fmod(deg,360.0);
	if(r<0.0){
		r+=360.0;
	}
	if(r>=360.0){
		r=0.0;
	}
	return r;
}

double norm180(double deg){
	double r=norm360(deg);
	if(r>180.0){
		r-=360.0;
	}
	return r;
}

long floor_div(long a,long b){
	long q=a/b;
	if((a%b!=0)&&((a<0)!=(b<0))){
		--q;
	}
	return q;
}

long floor_mod(long a,long b){ return a-floor_div(a,b)*b; }

double greg2jd(int year,int month,int day,int hour,int minute,double second){
	int Y=year;
	int M=month;
	if(M<=2){
		Y-=1;
		M+=12;
	}
	int A=static_cast<int>(std::floor(Y/100.0));
	int B=2-A+static_cast<int>(std::floor(A/4.0));

	double day_frac=(hour+(minute+second/60.0)/60.0)/24.0;

	return std::floor(365.25*(Y+4716))+std::floor(30.6001*(M+1))+day+B-
		   1524.5+day_frac;
}

void jd2greg(double jd,int&year,int&month,int&day,int&hour,int&minute,
			 double&second){
	double Z_d=std::floor(jd+0.5);
	double F=(jd+0.5)-Z_d;
	long Z=static_cast<long>(Z_d);
	long alpha=static_cast<long>(std::floor((Z-1867216.25)/36524.25));
	long A=Z+1+alpha-floor_div(alpha,4);
	long B=A+1524;
	long C=static_cast<long>(std::floor((B-122.1)/365.25));
	long D=static_cast<long>(std::floor(365.25*C));
	long E=static_cast<long>((B-D)/30.6001);

	day=static_cast<int>(B-D-static_cast<long>(std::floor(30.6001*E)));
	month=static_cast<int>(E<14?E-1:E-13);
	year=static_cast<int>(month>2?C-4716:C-4715);

	double tot_secs=F*SEC_DAY;
	if(tot_secs<0){
		tot_secs=0;
	}
	hour=static_cast<int>(tot_secs/3600.0);
	tot_secs-=hour*3600.0;
	minute=static_cast<int>(tot_secs/60.0);
	second=tot_secs-minute*60.0;
}

CivilDT::CivilDT()
	: year(1970),month(1),day(1),hour(0),minute(0),second(0.0),off_min(0){}

CivilDT CivilDT::from_unix(double ts,int off_min){
	CivilDT t;
	t.off_min=off_min;
	// split on whole days first so sub-second precision survives large ts
	double local=ts+off_min*60.0;
	double days=std::floor(local/SEC_DAY);
	double sod=local-days*SEC_DAY;
	int h=0;
	int mi=0;
	double s=0.0;
	jd2greg(JD_UNIX+days,t.year,t.month,t.day,h,mi,s);
	t.hour=static_cast<int>(sod/3600.0);
	sod-=t.hour*3600.0;
	t.minute=static_cast<int>(sod/60.0);
	t.second=sod-t.minute*60.0;
	return t;
}

double unix_of(int year,int month,int day,int hour,int minute,double second,
			   int off_min){
	double jd0=greg2jd(year,month,day);
	double days=std::floor(jd0-JD_UNIX+0.5);
	return days*SEC_DAY+hour*3600.0+minute*60.0+second-off_min*60.0;
}
