#include "pillar/pillar.hpp"

#include<algorithm>
#include<cmath>
#include<ostream>
#include<thread>

#include "pillar/batch.hpp"
#include "pillar/math.hpp"

namespace{

// mean solar motion, degrees per day
constexpr double SUN_MEAN_RATE=0.9856474;

constexpr double JIE_SPAN=30.0;

bool valid_stem(int s){ return s>=0&&s<STEMS; }

// longest month length usable every year; Feb 29 has no date in common years
int max_bound_day(int month){
	static const int len[12]={31,28,31,30,31,30,31,31,30,31,30,31};
	return len[month-1];
}

}

void PillarCfg::validate() const{
	if(!std::isnan(std_mer)&&
	   (!std::isfinite(std_mer)||std_mer<-180.0||std_mer>180.0)){
		throw RangeError("standard meridian out of [-180,180]");
	}
	if(year_pol.rule==YearRule::LON){
		term_idx(year_pol.lon);
	}else if(year_pol.month<1||year_pol.month>12||year_pol.day<1||
			 year_pol.day>max_bound_day(year_pol.month)){
		throw RangeError("year boundary date is not a calendar date");
	}
	if(eot_order<0||eot_order>EOT_MAX_ORDER){
		throw RangeError("equation of time order out of range");
	}
	if(!(root_tol>0.0)||root_iter<1){
		throw RangeError("root-find tolerance and iteration budget must be "
						 "positive");
	}
	if(!(scan_step>0.0)||!(scan_step<term_margin)){
		throw RangeError("scan step must be positive and below the term "
						 "margin");
	}
	if(!std::isfinite(ref.ts)){
		throw RangeError("reference epoch is not finite");
	}
	SexaUnit::from_val(ref.day_val);
	SexaUnit::from_val(ref.year_val);
	if(!is_jie(term_idx(jie_origin))){
		throw RangeError("month origin must be a sectional term");
	}
	if(jie_branch<0||jie_branch>=BRANCHES){
		throw RangeError("month origin branch out of [0,11]");
	}
	for(int s : month_stems){
		if(!valid_stem(s)){
			throw RangeError("month stem table entry out of [0,9]");
		}
		if(s%2!=jie_branch%2){
			throw InvalidCombination("month stem table parity does not match "
									 "the origin branch");
		}
	}
	for(int s : hour_stems){
		if(!valid_stem(s)){
			throw RangeError("hour stem table entry out of [0,9]");
		}
		if(s%2!=0){
			throw InvalidCombination("hour stem table entries must be even");
		}
	}
	if(!std::isnan(eot_from)&&!std::isnan(eot_to)&&!(eot_from<eot_to)){
		throw RangeError("equation of time window is empty");
	}
}

RootOpt PillarCfg::root_opt() const{
	RootOpt o;
	o.tol_deg=root_tol;
	o.max_iter=root_iter;
	o.scan_days=scan_step;
	return o;
}

bool CoordSet::same_pillars(const CoordSet&b) const{
	return year==b.year&&month==b.month&&day==b.day&&hour==b.hour;
}

PillarCal::PillarCal(SunLonSrc&s,const PillarCfg&c,
					 std::shared_ptr<TermCache> shared)
	: src(s),cfg(c),cache(shared?shared:std::make_shared<TermCache>()),
	  eot(c.eot_order,&s),atc(eot),
	  terms(s,c.root_opt(),*cache,c.term_margin){
	cfg.validate();
	eot.valid_from=cfg.eot_from;
	eot.valid_to=cfg.eot_to;
	atc.max_iter=cfg.root_iter;
	atc.solar=cfg.solar_corr;
}

double PillarCal::meridian_for(double lon) const{
	return std::isnan(cfg.std_mer)?infer_meridian(lon):cfg.std_mer;
}

std::pair<int,double> PillarCal::year_of(double ts,double std_mer){
	const YearPolicy&pol=cfg.year_pol;
	if(pol.rule==YearRule::LON){
		int y=CivilDT::from_unix(ts).year;
		TermNode node=terms.get_st(pol.lon,y);
		if(ts>=node.ts){
			return {y,node.ts};
		}
		return {y-1,terms.get_st(pol.lon,y-1).ts};
	}

	int off=static_cast<int>(std::lround(std_mer*MIN_PER_DEG));
	int y=CivilDT::from_unix(ts,off).year;
	double b=unix_of(y,pol.month,pol.day,0,0,0.0,off);
	if(ts>=b){
		return {y,b};
	}
	return {y-1,unix_of(y-1,pol.month,pol.day,0,0,0.0,off)};
}

TermNode PillarCal::jie_node(int ord,double near_ts){
	double lon=norm360(cfg.jie_origin+JIE_SPAN*ord);
	return terms.get_st(lon,CivilDT::from_unix(near_ts).year);
}

std::pair<int,double> PillarCal::month_of(double ts){
	double since=norm360(sun_lon_ok(src,ts)-cfg.jie_origin);
	int ord=std::min(11,static_cast<int>(std::floor(since/JIE_SPAN)));
	double back=(since-JIE_SPAN*ord)/SUN_MEAN_RATE*SEC_DAY;
	TermNode node=jie_node(ord,ts-back);

	if(node.ts>ts){
		// the located boundary lies just after ts
		ord=(ord+11)%12;
		node=jie_node(ord,node.ts-JIE_SPAN/SUN_MEAN_RATE*SEC_DAY);
	}else if(JIE_SPAN*(ord+1)-since<0.01){
		TermNode next=jie_node((ord+1)%12,ts);
		if(next.ts<=ts){
			ord=(ord+1)%12;
			node=next;
		}
	}
	return {ord,node.ts};
}

SexaUnit PillarCal::year_unit(int pillar_year) const{
	return SexaUnit::from_val(cfg.ref.year_val)
		.advance(static_cast<long>(pillar_year)-cfg.ref.year_no);
}

SexaUnit PillarCal::month_unit(const SexaUnit&year,int ord) const{
	int stem=(cfg.month_stems[year.stem()%5]+ord)%STEMS;
	int branch=(cfg.jie_branch+ord)%BRANCHES;
	return SexaUnit::from_sb(stem,branch);
}

SexaUnit PillarCal::day_unit(long day_no) const{
	long ref_day=static_cast<long>(std::floor(cfg.ref.ts/SEC_DAY));
	return SexaUnit::from_val(cfg.ref.day_val).advance(day_no-ref_day);
}

int PillarCal::hour_slot(double tod_hours){
	return static_cast<int>(std::floor((tod_hours+1.0)/2.0))%BRANCHES;
}

SexaUnit PillarCal::hour_unit(const SexaUnit&day,double tod_hours) const{
	int slot=hour_slot(tod_hours);
	if(tod_hours>=23.0){
		// late Zi: current day, next day's Zi stem
		return SexaUnit::from_sb(cfg.hour_stems[day.advance(1).stem()%5],0);
	}
	int stem=(cfg.hour_stems[day.stem()%5]+slot)%STEMS;
	return SexaUnit::from_sb(stem,slot);
}

CoordSet PillarCal::convert(double ts,double lon){
	Instant at(ts,lon);
	double mer=meridian_for(lon);

	AppTime app=atc.resolve(at,mer);
	auto yr=year_of(ts,mer);
	auto mo=month_of(ts);

	SexaUnit y=year_unit(yr.first);
	SexaUnit m=month_unit(y,mo.first);
	SexaUnit d=day_unit(app.day_no);
	SexaUnit h=hour_unit(d,app.tod_hours);

	return CoordSet{y,m,d,h,at,app,app.offset_min,yr.first,mo.first,
					mo.second,yr.second};
}

std::vector<ConvItem> PillarCal::conv_batch(const std::vector<double>&ts,
											double lon,int jobs){
	std::vector<ConvItem> results(ts.size());
	if(ts.empty()){
		return results;
	}

	std::size_t wk_count=jobs<1?1:static_cast<std::size_t>(jobs);
	wk_count=std::min(wk_count,ts.size());

	if(wk_count<=1){
		for(std::size_t i=0;i<ts.size();++i){
			conv_one(*this,ts[i],lon,results[i]);
		}
	}else{
		std::atomic<std::size_t> cursor(0);
		BatchCtx ctx{this,&ts,lon,&results,&cursor};
		std::vector<std::thread> workers;
		workers.reserve(wk_count);
		for(std::size_t i=0;i<wk_count;++i){
			workers.emplace_back(run_wkr,&ctx);
		}
		for(auto&th : workers){
			th.join();
		}
	}

	if(log){
		std::size_t failed=0;
		for(std::size_t i=0;i<results.size();++i){
			if(!results[i].ok()){
				++failed;
				(*log)<<"  item "<<i<<" failed: "<<err_name(results[i].kind)
					  <<": "<<results[i].error<<std::endl;
			}
		}
		(*log)<<"converted "<<results.size()-failed<<"/"<<results.size()
			  <<" instants with "<<wk_count<<" worker(s)"<<std::endl;
	}
	return results;
}
