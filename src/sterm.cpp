#include "pillar/sterm.hpp"

#include<algorithm>
#include<cmath>
#include<iomanip>
#include<limits>
#include<mutex>
#include<ostream>
#include<sstream>

#include "pillar/errors.hpp"
#include "pillar/math.hpp"

int term_idx(double lon){
	if(!std::isfinite(lon)){
		throw RangeError("solar term longitude is not finite");
	}
	double n=norm360(lon)/TERM_STEP;
	double r=std::round(n);
	if(std::fabs(n-r)>1e-9){
		throw RangeError("solar term longitude is not a multiple of 15: "+
						 std::to_string(lon));
	}
	return static_cast<int>(r)%TERM_COUNT;
}

bool is_jie(int idx){ return idx%2==1; }

double st_guess(int year,double lon){
	double Y=(year-2000)/1000.0;
	double jd_eq=2451623.80984+365242.37404*Y+0.05169*Y*Y;
	double jd=jd_eq+norm360(lon)/360.0*YEAR_DAYS;
	if(jd>=greg2jd(year+1,1,1)){
		jd-=YEAR_DAYS;
	}
	if(jd<greg2jd(year,1,1)){
		jd+=YEAR_DAYS;
	}
	return jd2unix(jd);
}

TermLoc::TermLoc(SunLonSrc&s,const RootOpt&o) : src(s),opt(o){
	if(!(opt.tol_deg>0.0)){
		throw RangeError("root-find tolerance must be positive");
	}
	if(opt.max_iter<1){
		throw RangeError("root-find iteration budget must be >= 1");
	}
	if(!(opt.scan_days>0.0)){
		throw RangeError("scan step must be positive");
	}
}

double TermLoc::f_sterm(double ts,double tgt){
	return norm180(sun_lon_ok(src,ts)-tgt);
}

TermNode TermLoc::locate(double tgt,double t_lo,double t_hi){
	if(!std::isfinite(tgt)){
		throw RangeError("target longitude is not finite");
	}
	if(!std::isfinite(t_lo)||!std::isfinite(t_hi)||!(t_hi>t_lo)){
		throw RangeError("search window is empty or not finite");
	}
	tgt=norm360(tgt);

	const double step=opt.scan_days*SEC_DAY;
	std::vector<double> ts;
	for(long k=0;;++k){
		double t=t_lo+static_cast<double>(k)*step;
		if(!(t<t_hi)){
			break;
		}
		ts.push_back(t);
	}
	ts.push_back(t_hi);

	std::vector<double> fs(ts.size());
	for(std::size_t i=0;i<ts.size();++i){
		fs[i]=f_sterm(ts[i],tgt);
	}

	std::vector<Bracket> hits;
	std::vector<TermNode> roots;
	for(std::size_t i=0;i<ts.size();++i){
		if(fs[i]==0.0&&ts[i]<t_hi){
			TermNode node;
			node.lon=tgt;
			node.ts=ts[i];
			roots.push_back(node);
		}
		if(i+1==ts.size()){
			break;
		}
		double fa=fs[i];
		double fb=fs[i+1];
		// a jump across +-180 is the opposite point of the circle
		if(fa*fb<0.0&&std::fabs(fb-fa)<180.0){
			hits.push_back({ts[i],ts[i+1],fa,fb});
		}
	}

	// t_hi is excluded: a crossing within tolerance of it opens the next
	// window, not this one
	if(!hits.empty()&&hits.back().b==t_hi&&
	   std::fabs(hits.back().fb)<=opt.tol_deg){
		hits.pop_back();
	}
	int found=static_cast<int>(hits.size()+roots.size());
	if(found!=1){
		throw AmbiguousWindow("expected one crossing of "+std::to_string(tgt)+
								  " deg in window, found "+
								  std::to_string(found),
							  found);
	}
	if(!roots.empty()){
		return roots.front();
	}

	TermNode node=refine(tgt,hits.front());
	if(node.ts>=t_hi){
		throw AmbiguousWindow("crossing of "+std::to_string(tgt)+
								  " deg resolved outside the window",
							  0);
	}
	return node;
}

TermNode TermLoc::refine(double tgt,const Bracket&br){
	double a=br.a;
	double b=br.b;
	double fa=br.fa;
	double fb=br.fb;
	double x=a-fa*(b-a)/(fb-fa);

	for(int iter=1;iter<=opt.max_iter;++iter){
		double f=f_sterm(x,tgt);
		if(std::fabs(f)<=opt.tol_deg){
			TermNode node;
			node.lon=tgt;
			node.ts=x;
			node.resid=std::fabs(f);
			node.iters=iter;
			return node;
		}
		if((f<0.0)==(fa<0.0)){
			a=x;
			fa=f;
		}else{
			b=x;
			fb=f;
		}

		double x_new=std::numeric_limits<double>::quiet_NaN();
		double rate=sun_rate_ok(src,x);
		if(std::isfinite(rate)&&rate!=0.0){
			x_new=x-f/rate*SEC_DAY;
		}
		if(!(x_new>a&&x_new<b)){
			x_new=0.5*(a+b);
		}
		x=x_new;
	}

	throw ConvergenceError("solar term "+std::to_string(tgt)+
						   " deg did not converge in "+
						   std::to_string(opt.max_iter)+" iterations");
}

void TermCache::bind(const std::string&tag){
	std::unique_lock<std::shared_mutex> lock(mtx_);
	if(tag_.empty()){
		tag_=tag;
		return;
	}
	if(tag_!=tag){
		throw InvalidCombination("term cache filled by '"+tag_+
								 "' cannot serve '"+tag+"'");
	}
}

bool TermCache::get(int idx,int year,TermNode&out) const{
	std::shared_lock<std::shared_mutex> lock(mtx_);
	auto it=map_.find({idx,year});
	if(it==map_.end()){
		return false;
	}
	out=it->second;
	return true;
}

TermNode TermCache::put(int idx,const TermNode&node){
	std::unique_lock<std::shared_mutex> lock(mtx_);
	auto res=map_.emplace(std::make_pair(idx,node.year),node);
	return res.first->second;
}

std::size_t TermCache::size() const{
	std::shared_lock<std::shared_mutex> lock(mtx_);
	return map_.size();
}

void TermCache::clear(){
	std::unique_lock<std::shared_mutex> lock(mtx_);
	map_.clear();
	tag_.clear();
}

SolTerms::SolTerms(SunLonSrc&s,const RootOpt&o,TermCache&c,double margin)
	: loc(s,o),cache(c),margin_days(margin){
	if(!(margin_days>0.0)||margin_days>=YEAR_DAYS/2.0){
		throw RangeError("term search margin must be in (0, half a year)");
	}
	std::ostringstream tag;
	tag<<std::setprecision(17)<<s.name()<<" tol="<<o.tol_deg
	   <<" iter="<<o.max_iter<<" scan="<<o.scan_days<<" margin="<<margin;
	cache.bind(tag.str());
}

TermNode SolTerms::get_st(double lon,int year){
	int idx=term_idx(lon);
	TermNode node;
	if(cache.get(idx,year,node)){
		return node;
	}
	double tgt=idx*TERM_STEP;
	double guess=st_guess(year,tgt);
	double margin=margin_days*SEC_DAY;
	node=loc.locate(tgt,guess-margin,guess+margin);
	node.year=year;
	return cache.put(idx,node);
}

std::vector<TermNode> SolTerms::year_terms(int year,std::ostream*log,
										   std::vector<std::string>*errors){
	if(log){
		(*log)<<"solving solar terms of "<<year<<" ..."<<std::endl;
	}
	std::vector<TermNode> out;
	for(int idx=0;idx<TERM_COUNT;++idx){
		try{
			out.push_back(get_st(idx*TERM_STEP,year));
		}catch(const PillarError&ex){
			if(log){
				(*log)<<"  term "<<idx*TERM_STEP<<" failed: "<<ex.what()
					  <<std::endl;
			}
			if(errors){
				errors->push_back(std::string(err_name(ex.kind))+": "+
								  ex.what());
			}
		}
	}
	std::sort(out.begin(),out.end(),[](const TermNode&a,const TermNode&b){
		return a.ts<b.ts;
	});
	return out;
}
