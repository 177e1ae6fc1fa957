#include "pillar/cfg.hpp"

#include<cctype>
#include<cmath>
#include<fstream>
#include<iomanip>
#include<limits>
#include<sstream>
#include<stdexcept>

#include "pillar/app_long.hpp"

const std::string CFG_FILE="pillar_cfg.txt";

namespace{

std::string fmt_num(double v){
	if(std::isnan(v)){
		return "";
	}
	std::ostringstream oss;
	oss<<std::setprecision(15)<<v;
	return oss.str();
}

std::string fmt_stems(const std::array<int,5>&t){
	std::ostringstream oss;
	for(std::size_t i=0;i<t.size();++i){
		if(i){
			oss<<",";
		}
		oss<<t[i];
	}
	return oss.str();
}

std::array<int,5> parse_stems(const std::string&text,const std::string&label){
	std::array<int,5> out{};
	std::stringstream ss(text);
	std::string item;
	std::size_t n=0;
	while(std::getline(ss,item,',')){
		if(n>=out.size()){
			throw std::invalid_argument(label+" needs exactly 5 entries");
		}
		out[n++]=parse_int(trim(item),label);
	}
	if(n!=out.size()){
		throw std::invalid_argument(label+" needs exactly 5 entries");
	}
	return out;
}

bool parse_flag(const std::string&text,const std::string&label){
	if(text=="1"||text=="true"||text=="yes"){
		return true;
	}
	if(text=="0"||text=="false"||text=="no"){
		return false;
	}
	throw std::invalid_argument(label+" must be 0 or 1");
}

}

std::string trim(const std::string&s){
	std::size_t start=0;
	while(start<s.size()&&std::isspace(static_cast<unsigned char>(s[start]))){
		++start;
	}
	std::size_t end=s.size();
	while(end>start&&std::isspace(static_cast<unsigned char>(s[end-1]))){
		--end;
	}
	return s.substr(start,end-start);
}

int parse_int(const std::string&text,const std::string&label){
	std::size_t pos=0;
	int v=0;
	try{
		v=std::stoi(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

double parse_num(const std::string&text,const std::string&label){
	std::size_t pos=0;
	double v=0.0;
	try{
		v=std::stod(text,&pos);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	if(pos!=text.size()||!std::isfinite(v)){
		throw std::invalid_argument("invalid "+label+": "+text);
	}
	return v;
}

YearPolicy parse_policy(const std::string&text){
	YearPolicy p;
	auto colon=text.find(':');
	if(colon==std::string::npos){
		throw std::invalid_argument(
			"year policy must be lon:<deg> or date:<month>-<day>");
	}
	std::string kind=text.substr(0,colon);
	std::string arg=text.substr(colon+1);
	if(kind=="lon"){
		p.rule=YearRule::LON;
		p.lon=parse_num(arg,"year policy longitude");
		return p;
	}
	if(kind=="date"){
		auto dash=arg.find('-');
		if(dash==std::string::npos){
			throw std::invalid_argument("year policy date must be <month>-<day>");
		}
		p.rule=YearRule::DATE;
		p.month=parse_int(arg.substr(0,dash),"year policy month");
		p.day=parse_int(arg.substr(dash+1),"year policy day");
		return p;
	}
	throw std::invalid_argument("unknown year policy: "+kind);
}

std::string fmt_policy(const YearPolicy&p){
	if(p.rule==YearRule::LON){
		return "lon:"+fmt_num(p.lon);
	}
	return "date:"+std::to_string(p.month)+"-"+std::to_string(p.day);
}

void set_key(AppCfg&cfg,const std::string&key,const std::string&value){
	PillarCfg&pc=cfg.pc;
	if(key=="std_meridian"){
		pc.std_mer=value.empty()?std::numeric_limits<double>::quiet_NaN()
								:parse_num(value,key);
	}else if(key=="solar_correction"){
		pc.solar_corr=parse_flag(value,key);
	}else if(key=="year_policy"){
		pc.year_pol=parse_policy(value);
	}else if(key=="eot_order"){
		pc.eot_order=parse_int(value,key);
	}else if(key=="root_tol"){
		pc.root_tol=parse_num(value,key);
	}else if(key=="root_iter"){
		pc.root_iter=parse_int(value,key);
	}else if(key=="term_margin"){
		pc.term_margin=parse_num(value,key);
	}else if(key=="scan_step"){
		pc.scan_step=parse_num(value,key);
	}else if(key=="ref_epoch"){
		pc.ref.ts=parse_num(value,key);
	}else if(key=="ref_day"){
		pc.ref.day_val=parse_int(value,key);
	}else if(key=="ref_year"){
		pc.ref.year_no=parse_int(value,key);
	}else if(key=="ref_year_val"){
		pc.ref.year_val=parse_int(value,key);
	}else if(key=="jie_origin"){
		pc.jie_origin=parse_num(value,key);
	}else if(key=="jie_branch"){
		pc.jie_branch=parse_int(value,key);
	}else if(key=="month_stems"){
		pc.month_stems=parse_stems(value,key);
	}else if(key=="hour_stems"){
		pc.hour_stems=parse_stems(value,key);
	}else if(key=="eot_from"){
		pc.eot_from=value.empty()?std::numeric_limits<double>::quiet_NaN()
								 :parse_num(value,key);
	}else if(key=="eot_to"){
		pc.eot_to=value.empty()?std::numeric_limits<double>::quiet_NaN()
							   :parse_num(value,key);
	}else if(key=="provider"){
		if(value!="series"&&value!="spice"){
			throw std::invalid_argument("provider must be series or spice");
		}
		cfg.provider=value;
	}else if(key=="ephem"){
		cfg.ephem=value;
	}else if(key=="jobs"){
		cfg.jobs=parse_int(value,key);
		if(cfg.jobs<1){
			throw std::invalid_argument("jobs must be >= 1");
		}
	}else if(key=="format"){
		if(value!="txt"&&value!="json"){
			throw std::invalid_argument("format must be txt or json");
		}
		cfg.format=value;
	}else if(key=="tz"){
		cfg.tz=value;
	}else if(key=="pretty"){
		cfg.pretty=parse_flag(value,key);
	}else{
		throw std::invalid_argument("unknown config key: "+key);
	}
}

std::vector<std::pair<std::string,std::string>> cfg_items(const AppCfg&cfg){
	const PillarCfg&pc=cfg.pc;
	return {
		{"std_meridian",fmt_num(pc.std_mer)},
		{"solar_correction",pc.solar_corr?"1":"0"},
		{"year_policy",fmt_policy(pc.year_pol)},
		{"eot_order",std::to_string(pc.eot_order)},
		{"root_tol",fmt_num(pc.root_tol)},
		{"root_iter",std::to_string(pc.root_iter)},
		{"term_margin",fmt_num(pc.term_margin)},
		{"scan_step",fmt_num(pc.scan_step)},
		{"ref_epoch",fmt_num(pc.ref.ts)},
		{"ref_day",std::to_string(pc.ref.day_val)},
		{"ref_year",std::to_string(pc.ref.year_no)},
		{"ref_year_val",std::to_string(pc.ref.year_val)},
		{"jie_origin",fmt_num(pc.jie_origin)},
		{"jie_branch",std::to_string(pc.jie_branch)},
		{"month_stems",fmt_stems(pc.month_stems)},
		{"hour_stems",fmt_stems(pc.hour_stems)},
		{"eot_from",fmt_num(pc.eot_from)},
		{"eot_to",fmt_num(pc.eot_to)},
		{"provider",cfg.provider},
		{"ephem",cfg.ephem},
		{"jobs",std::to_string(cfg.jobs)},
		{"format",cfg.format},
		{"tz",cfg.tz},
		{"pretty",cfg.pretty?"1":"0"},
	};
}

bool load_cfg(AppCfg&cfg,const std::string&path){
	std::ifstream ifs(path);
	if(!ifs){
		return false;
	}
	std::string line;
	int line_no=0;
	while(std::getline(ifs,line)){
		++line_no;
		std::string t=trim(line);
		if(t.empty()||t[0]=='#'){
			continue;
		}
		auto pos=t.find('=');
		if(pos==std::string::npos){
			continue;
		}
		try{
			set_key(cfg,trim(t.substr(0,pos)),trim(t.substr(pos+1)));
		}catch(const std::invalid_argument&ex){
			throw std::invalid_argument(path+":"+std::to_string(line_no)+": "+
										ex.what());
		}
	}
	return true;
}

bool save_cfg(const AppCfg&cfg,const std::string&path){
	std::ofstream ofs(path);
	if(!ofs){
		return false;
	}
	for(const auto&kv : cfg_items(cfg)){
		ofs<<kv.first<<"="<<kv.second<<"\n";
	}
	return static_cast<bool>(ofs);
}

std::unique_ptr<SunLonSrc> make_src(const AppCfg&cfg){
	if(cfg.provider=="spice"){
		if(cfg.ephem.empty()){
			throw std::invalid_argument("provider spice needs --ephem <bsp>");
		}
		return std::unique_ptr<SunLonSrc>(new SpiceSun(cfg.ephem));
	}
	return std::unique_ptr<SunLonSrc>(new SeriesSun());
}
