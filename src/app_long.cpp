#include "pillar/app_long.hpp"

#include<algorithm>
#include<cmath>

#include "pillar/time_scale.hpp"

double AberCorr::lightday(const Vec3&vec){ return vec.norm()/C_AUDAY; }

RetProp AberCorr::geo_prop(EphRead&eph,int target,double jd_tdb,int max_iter){
	auto earth=eph.get_state(eph.EARTH,eph.SSB,jd_tdb);
	const Vec3&xE=earth.first;
	const Vec3&vE=earth.second;

	double tr=jd_tdb;
	for(int i=0;i<max_iter;++i){
		Vec3 X=eph.get_pos(target,eph.SSB,tr)-xE;
		double tr_new=jd_tdb-lightday(X);
		if(std::fabs(tr_new-tr)<1e-12){
			tr=tr_new;
			break;
		}
		tr=tr_new;
	}

	auto st=eph.get_state(target,eph.SSB,tr);
	return {st.first-xE,st.second-vE,tr};
}

Vec3 AberCorr::aberrate(const Vec3&X,const Vec3&vE){
	double r=X.norm();
	if(r==0.0){
		return X;
	}
	Vec3 n=X/r;
	Vec3 beta=vE/C_AUDAY;
	double beta2=Vec3::dot(beta,beta);
	double gamma_inv=std::sqrt(std::max(0.0,1.0-beta2));
	double nb=Vec3::dot(n,beta);

	Vec3 n_app=(gamma_inv*n+beta+(nb*beta)/(1.0+gamma_inv))/(1.0+nb);
	double n_norm=n_app.norm();
	if(n_norm==0.0){
		return X;
	}
	return (n_app/n_norm)*r;
}

SpiceSun::SpiceSun(const std::string&bsp_path)
	: eph_(new EphRead(bsp_path)){}

std::pair<double,double> SpiceSun::sun_calc(double jd_tdb){
	RetProp st=AberCorr::geo_prop(*eph_,eph_->SUN,jd_tdb);
	Vec3 vE=eph_->get_state(eph_->EARTH,eph_->SSB,jd_tdb).second;
	Vec3 X=AberCorr::aberrate(st.X,vE);

	Mat3 R=CoordTf::R1(PrecNut::true_obl(jd_tdb))*pn_.bpn_mat(jd_tdb);
	Vec3 Xec=R*X;
	double lam=std::atan2(Xec.y,Xec.x);
	if(lam<0){
		lam+=TWO_PI;
	}

	Vec3 Xec_dot=R*st.V;
	double denom=Xec.x*Xec.x+Xec.y*Xec.y;
	double lam_dot=0.0;
	if(denom!=0.0){
		lam_dot=(Xec.x*Xec_dot.y-Xec.y*Xec_dot.x)/denom;
	}
	return {lam,lam_dot};
}

double SpiceSun::lon_at(double ts){
	return sun_calc(TimeScale::unix_to_tdb(ts)).first*RAD2DEG;
}

double SpiceSun::rate_at(double ts){
	return sun_calc(TimeScale::unix_to_tdb(ts)).second*RAD2DEG;
}
