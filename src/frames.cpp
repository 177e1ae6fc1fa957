#include "pillar/frames.hpp"

#include<cmath>

extern "C"{
#include "erfa.h"
}

namespace{

void split_jd(double jd,double&d1,double&d2){
	d1=std::floor(jd);
	d2=jd-d1;
}

Mat3 to_mat(double r[3][3]){
	Mat3 M;
	for(int i=0;i<3;++i){
		for(int j=0;j<3;++j){
			M.m[i][j]=r[i][j];
		}
	}
	return M;
}

}

Mat3 CoordTf::R1(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R;
	R.m[0][0]=1.0;
	R.m[1][1]=c;
	R.m[1][2]=s;
	R.m[2][1]=-s;
	R.m[2][2]=c;
	return R;
}

Mat3 PrecNut::bpn_mat(double jd_tdb) const{
	double d1,d2;
	split_jd(jd_tdb,d1,d2);
	double epj=2000.0+(jd_tdb-JD_J2000)/365.25;
	bool vondrak=model==PrecModel::VONDRAK||
				 (model==PrecModel::AUTO&&std::fabs(epj-2000.0)>=long_thr);
	if(!vondrak){
		double r[3][3];
		eraPnm06a(d1,d2,r);
		return to_mat(r);
	}

	double rbp[3][3];
	eraLtpb(epj,rbp);
	double rn[3][3];
	eraNum06a(d1,d2,rn);
	return to_mat(rn)*to_mat(rbp);
}

double PrecNut::mean_obl(double jd_tdb){
	double d1,d2;
	split_jd(jd_tdb,d1,d2);
	return eraObl06(d1,d2);
}

std::pair<double,double> PrecNut::nut_ang(double jd_tdb){
	double d1,d2;
	split_jd(jd_tdb,d1,d2);
	double dpsi=0.0;
	double deps=0.0;
	eraNut06a(d1,d2,&dpsi,&deps);
	return {dpsi,deps};
}

double PrecNut::true_obl(double jd_tdb){
	return mean_obl(jd_tdb)+nut_ang(jd_tdb).second;
}
