#include "pillar/cli.hpp"

#include<algorithm>
#include<cctype>
#include<cmath>
#include<iomanip>
#include<iostream>
#include<limits>
#include<memory>
#include<sstream>
#include<stdexcept>

#include "pillar/cfg.hpp"
#include "pillar/format.hpp"
#include "pillar/js_writer.hpp"
#include "pillar/math.hpp"
#include "pillar/pillar.hpp"

namespace cli_util{

bool is_opt(const std::string&s){ return !s.empty()&&s[0]=='-'; }

std::string to_low(std::string s){
	for(char&c : s){
		c=static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

bool parse_bool01(const std::string&text,const std::string&label){
	if(text=="0"){
		return false;
	}
	if(text=="1"){
		return true;
	}
	throw std::invalid_argument(label+" must be 0 or 1");
}

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt){
	if(idx+1>=args.size()){
		throw std::invalid_argument("missing value for option: "+opt);
	}
	++idx;
	return args[idx];
}

OutTgt open_out(const std::string&path){
	OutTgt out;
	if(path.empty()){
		out.stream=&std::cout;
		return out;
	}
	out.file.open(path,std::ios::binary);
	if(!out.file){
		throw std::runtime_error("failed to open output file: "+path);
	}
	out.stream=&out.file;
	return out;
}

void note_out(const std::string&path,bool quiet){
	if(!path.empty()&&!quiet){
		std::cerr<<"written: "<<path<<std::endl;
	}
}

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx){
	if(allowed.find(format)==allowed.end()){
		throw std::invalid_argument("invalid --format for "+ctx+": "+format);
	}
}

} // namespace cli_util

using namespace cli_util;

namespace{

const char*SCHEMA="pillar.v1";

struct RunOpt{
	AppCfg cfg;
	double lon=std::numeric_limits<double>::quiet_NaN();
	std::string out;
	bool quiet=false;
};

RunOpt load_def(){
	RunOpt o;
	load_cfg(o.cfg);
	o.cfg.format=to_low(o.cfg.format);
	return o;
}

// options shared by every conversion command; false if opt is not one
bool take_com(RunOpt&o,const std::vector<std::string>&args,std::size_t&i){
	const std::string&opt=args[i];
	if(opt=="--lon"){
		o.lon=parse_num(req_val(args,i,opt),"--lon");
	}else if(opt=="--meridian"){
		set_key(o.cfg,"std_meridian",req_val(args,i,opt));
	}else if(opt=="--mean"){
		o.cfg.pc.solar_corr=false;
	}else if(opt=="--policy"){
		set_key(o.cfg,"year_policy",req_val(args,i,opt));
	}else if(opt=="--eot-order"){
		set_key(o.cfg,"eot_order",req_val(args,i,opt));
	}else if(opt=="--tol"){
		set_key(o.cfg,"root_tol",req_val(args,i,opt));
	}else if(opt=="--iter"){
		set_key(o.cfg,"root_iter",req_val(args,i,opt));
	}else if(opt=="--provider"){
		set_key(o.cfg,"provider",to_low(req_val(args,i,opt)));
	}else if(opt=="--ephem"){
		o.cfg.ephem=req_val(args,i,opt);
	}else if(opt=="--tz"){
		std::string tz=req_val(args,i,opt);
		parse_tz(tz);
		o.cfg.tz=tz;
	}else if(opt=="--format"){
		o.cfg.format=to_low(req_val(args,i,opt));
	}else if(opt=="--out"){
		o.out=req_val(args,i,opt);
	}else if(opt=="--pretty"){
		o.cfg.pretty=parse_bool01(req_val(args,i,opt),"--pretty");
	}else if(opt=="--quiet"){
		o.quiet=true;
	}else{
		return false;
	}
	return true;
}

double need_lon(const RunOpt&o,const std::string&cmd){
	if(std::isnan(o.lon)){
		throw std::invalid_argument(cmd+" requires --lon <deg>");
	}
	return o.lon;
}

std::string fmt_num(double v,int prec=6){
	std::ostringstream oss;
	oss<<std::fixed<<std::setprecision(prec)<<v;
	return oss.str();
}

std::string app_date(const AppTime&app){
	std::ostringstream oss;
	oss<<std::setfill('0')<<std::setw(4)<<app.year<<'-'<<std::setw(2)
	   <<app.month<<'-'<<std::setw(2)<<app.day;
	return oss.str();
}

void put_meta(JsonWriter&w,const std::string&type){
	w.key("meta");
	w.obj_begin();
	w.field("tool","pillar");
	w.field("schema",SCHEMA);
	w.field("type",type);
	w.obj_end();
}

void put_unit(JsonWriter&w,const std::string&name,const SexaUnit&u){
	w.key(name);
	w.obj_begin();
	w.field("value",u.value());
	w.field("stem",u.stem());
	w.field("branch",u.branch());
	w.obj_end();
}

void put_coord(JsonWriter&w,const CoordSet&c,int tz_off){
	w.field("time",fmt_iso(c.at.ts(),tz_off));
	w.field("ts",c.at.ts());
	w.field("lon",c.at.lon());
	w.field("meridian",c.app.std_mer);
	put_unit(w,"year",c.year);
	put_unit(w,"month",c.month);
	put_unit(w,"day",c.day);
	put_unit(w,"hour",c.hour);
	w.key("apparent");
	w.obj_begin();
	w.field("date",app_date(c.app));
	w.field("time",fmt_hms(c.app.tod_hours*60.0));
	w.field("day_start",fmt_iso(c.app.day_start,tz_off));
	w.field("eot_min",c.app.eot_min,10);
	w.field("offset_min",c.offset_min,10);
	w.field("utc_offset_min",c.app.utc_off_min,10);
	w.obj_end();
	w.field("pillar_year",c.pillar_year);
	w.field("year_start",fmt_iso(c.year_start,tz_off));
	w.field("month_ord",c.month_ord);
	w.field("month_start",fmt_iso(c.month_start,tz_off));
}

void put_coord(std::ostream&os,const CoordSet&c,int tz_off){
	os<<"time="<<fmt_iso(c.at.ts(),tz_off)<<" lon="<<fmt_num(c.at.lon(),4)
	  <<" meridian="<<fmt_num(c.app.std_mer,4)<<"\n";
	os<<"year="<<fmt_unit(c.year)<<" month="<<fmt_unit(c.month)
	  <<" day="<<fmt_unit(c.day)<<" hour="<<fmt_unit(c.hour)<<"\n";
	os<<"apparent="<<app_date(c.app)<<" "<<fmt_hms(c.app.tod_hours*60.0)
	  <<" eot="<<fmt_hms(c.app.eot_min)<<" offset="<<fmt_hms(c.offset_min)
	  <<" utc_offset="<<fmt_hms(c.app.utc_off_min)<<"\n";
	os<<"year_start="<<fmt_iso(c.year_start,tz_off)
	  <<" month_start="<<fmt_iso(c.month_start,tz_off)
	  <<" month_ord="<<c.month_ord<<"\n";
}

std::vector<std::string> read_lines(std::istream&is){
	std::vector<std::string> out;
	std::string line;
	while(std::getline(is,line)){
		out.push_back(trim(line));
	}
	return out;
}

struct BatchLine{
	std::size_t line_no;
	std::string input;
	ConvItem item;
};

} // namespace

std::string tool_ver(){ return "pillar-2026.10"; }

int cmd_at(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_at();
		return 0;
	}

	RunOpt o=load_def();
	std::string time_raw;
	std::size_t i=0;
	if(!is_opt(args[0])){
		time_raw=args[0];
		i=1;
	}
	for(;i<args.size();++i){
		const std::string&opt=args[i];
		if(take_com(o,args,i)){
			continue;
		}
		if(opt=="--time"){
			time_raw=req_val(args,i,opt);
		}else if(opt=="-h"||opt=="--help"){
			use_at();
			return 0;
		}else{
			throw std::invalid_argument("unknown option for at: "+opt);
		}
	}
	if(time_raw.empty()){
		throw std::invalid_argument("at requires a <time> or --time <time>");
	}
	chk_fmt(o.cfg.format,{"txt","json"},"at");
	double lon=need_lon(o,"at");
	int tz_off=parse_tz(o.cfg.tz);
	IsoTime t=parse_time(time_raw,o.cfg.tz);

	std::unique_ptr<SunLonSrc> src=make_src(o.cfg);
	PillarCal cal(*src,o.cfg.pc);
	CoordSet c=cal.convert(t.ts,lon);

	OutTgt out=open_out(o.out);
	if(o.cfg.format=="json"){
		JsonWriter w(*out.stream,o.cfg.pretty);
		w.obj_begin();
		put_meta(w,"at");
		w.field("provider",src->name());
		w.key("data");
		w.obj_begin();
		put_coord(w,c,tz_off);
		w.obj_end();
		w.obj_end();
		*out.stream<<"\n";
	}else{
		*out.stream<<"tool=pillar format=txt type=at provider="<<src->name()
				   <<"\n";
		put_coord(*out.stream,c,tz_off);
	}
	note_out(o.out,o.quiet);
	return 0;
}

int cmd_batch(const std::vector<std::string>&args){
	if(args.size()==1&&(args[0]=="-h"||args[0]=="--help")){
		use_batch();
		return 0;
	}

	RunOpt o=load_def();
	bool from_stdin=false;
	std::string input_file;
	int jobs=o.cfg.jobs;
	for(std::size_t i=0;i<args.size();++i){
		const std::string&opt=args[i];
		if(take_com(o,args,i)){
			continue;
		}
		if(opt=="--stdin"){
			from_stdin=true;
		}else if(opt=="--file"){
			input_file=req_val(args,i,opt);
		}else if(opt=="--jobs"){
			jobs=parse_int(req_val(args,i,opt),"--jobs");
			if(jobs<1){
				throw std::invalid_argument("--jobs must be >= 1");
			}
		}else if(opt=="-h"||opt=="--help"){
			use_batch();
			return 0;
		}else{
			throw std::invalid_argument("unknown option for batch: "+opt);
		}
	}
	if(from_stdin==!input_file.empty()){
		throw std::invalid_argument("batch requires exactly one of --stdin or "
									"--file <path>");
	}
	chk_fmt(o.cfg.format,{"txt","json"},"batch");
	double lon=need_lon(o,"batch");
	int tz_off=parse_tz(o.cfg.tz);

	std::vector<std::string> lines;
	if(from_stdin){
		lines=read_lines(std::cin);
	}else{
		std::ifstream ifs(input_file);
		if(!ifs){
			throw std::runtime_error("failed to open input file: "+input_file);
		}
		lines=read_lines(ifs);
	}

	// unparsable lines fail on their own, the rest go to the workers
	std::vector<BatchLine> rows;
	std::vector<double> stamps;
	std::vector<std::size_t> slot;
	for(std::size_t n=0;n<lines.size();++n){
		const std::string&s=lines[n];
		if(s.empty()||s[0]=='#'){
			continue;
		}
		BatchLine row{n+1,s,ConvItem{}};
		try{
			stamps.push_back(parse_time(s,o.cfg.tz).ts);
			slot.push_back(rows.size());
		}catch(const std::invalid_argument&ex){
			row.item.kind=ErrKind::RANGE;
			row.item.error=ex.what();
		}
		rows.push_back(row);
	}

	std::unique_ptr<SunLonSrc> src=make_src(o.cfg);
	PillarCal cal(*src,o.cfg.pc);
	if(!o.quiet){
		cal.log=&std::cerr;
	}
	std::vector<ConvItem> res=cal.conv_batch(stamps,lon,jobs);
	for(std::size_t k=0;k<res.size();++k){
		rows[slot[k]].item=res[k];
	}

	std::size_t failed=0;
	OutTgt out=open_out(o.out);
	if(o.cfg.format=="json"){
		JsonWriter w(*out.stream,o.cfg.pretty);
		w.obj_begin();
		put_meta(w,"batch");
		w.field("provider",src->name());
		w.key("data");
		w.arr_begin();
		for(const BatchLine&row : rows){
			w.obj_begin();
			w.field("line",static_cast<long>(row.line_no));
			w.field("input",row.input);
			w.field("ok",row.item.ok());
			if(row.item.ok()){
				put_coord(w,*row.item.coord,tz_off);
			}else{
				++failed;
				w.key("error");
				w.obj_begin();
				w.field("kind",err_name(row.item.kind));
				w.field("message",row.item.error);
				w.obj_end();
			}
			w.obj_end();
		}
		w.arr_end();
		w.obj_end();
		*out.stream<<"\n";
	}else{
		*out.stream<<"tool=pillar format=txt type=batch provider="
				   <<src->name()<<"\n";
		for(const BatchLine&row : rows){
			*out.stream<<row.line_no<<" "<<row.input;
			if(row.item.ok()){
				const CoordSet&c=*row.item.coord;
				*out.stream<<" year="<<fmt_unit(c.year)<<" month="
						   <<fmt_unit(c.month)<<" day="<<fmt_unit(c.day)
						   <<" hour="<<fmt_unit(c.hour)<<" offset="
						   <<fmt_hms(c.offset_min)<<"\n";
			}else{
				++failed;
				*out.stream<<" error "<<err_name(row.item.kind)<<": "
						   <<row.item.error<<"\n";
			}
		}
	}
	note_out(o.out,o.quiet);
	return failed?1:0;
}

int cmd_terms(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_terms();
		return 0;
	}

	RunOpt o=load_def();
	if(is_opt(args[0])){
		throw std::invalid_argument("terms requires: <year>");
	}
	int year=parse_int(args[0],"year");
	for(std::size_t i=1;i<args.size();++i){
		if(!take_com(o,args,i)){
			throw std::invalid_argument("unknown option for terms: "+args[i]);
		}
	}
	chk_fmt(o.cfg.format,{"txt","json"},"terms");
	int tz_off=parse_tz(o.cfg.tz);

	std::unique_ptr<SunLonSrc> src=make_src(o.cfg);
	PillarCal cal(*src,o.cfg.pc);
	std::vector<std::string> errors;
	std::vector<TermNode> nodes=cal.terms.year_terms(
		year,o.quiet?nullptr:&std::cerr,&errors);

	OutTgt out=open_out(o.out);
	if(o.cfg.format=="json"){
		JsonWriter w(*out.stream,o.cfg.pretty);
		w.obj_begin();
		put_meta(w,"terms");
		w.field("provider",src->name());
		w.field("year",year);
		w.key("data");
		w.arr_begin();
		for(const TermNode&n : nodes){
			w.obj_begin();
			w.field("lon",n.lon);
			w.field("jie",is_jie(term_idx(n.lon)));
			w.field("time",fmt_iso(n.ts,tz_off));
			w.field("ts",n.ts);
			w.field("resid_deg",n.resid);
			w.field("iters",n.iters);
			w.obj_end();
		}
		w.arr_end();
		w.key("errors");
		w.arr_begin();
		for(const std::string&e : errors){
			w.value(e);
		}
		w.arr_end();
		w.obj_end();
		*out.stream<<"\n";
	}else{
		*out.stream<<"tool=pillar format=txt type=terms year="<<year
				   <<" provider="<<src->name()<<"\n";
		for(const TermNode&n : nodes){
			*out.stream<<std::setw(3)<<static_cast<int>(n.lon)<<" "
					   <<(is_jie(term_idx(n.lon))?"jie  ":"zhong")<<" "
					   <<fmt_iso(n.ts,tz_off)<<"\n";
		}
		for(const std::string&e : errors){
			*out.stream<<"error "<<e<<"\n";
		}
	}
	note_out(o.out,o.quiet);
	return errors.empty()?0:1;
}

int cmd_eot(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_eot();
		return 0;
	}

	RunOpt o=load_def();
	if(is_opt(args[0])){
		throw std::invalid_argument("eot requires: <year>");
	}
	int year=parse_int(args[0],"year");
	double step=1.0;
	bool table=true;
	for(std::size_t i=1;i<args.size();++i){
		const std::string&opt=args[i];
		if(take_com(o,args,i)){
			continue;
		}
		if(opt=="--step"){
			step=parse_num(req_val(args,i,opt),"--step");
			if(!(step>0.0)){
				throw std::invalid_argument("--step must be > 0");
			}
		}else if(opt=="--table"){
			table=parse_bool01(req_val(args,i,opt),"--table");
		}else{
			throw std::invalid_argument("unknown option for eot: "+opt);
		}
	}
	chk_fmt(o.cfg.format,{"txt","json"},"eot");
	int tz_off=parse_tz(o.cfg.tz);

	std::unique_ptr<SunLonSrc> src=make_src(o.cfg);
	PillarCal cal(*src,o.cfg.pc);

	double t0=unix_of(year,1,1,0,0,0.0,tz_off);
	double t1=unix_of(year+1,1,1,0,0,0.0,tz_off);
	std::vector<std::pair<double,double>> rows;
	for(double t=t0;t<t1;t+=step*SEC_DAY){
		rows.emplace_back(t,cal.eot.minutes(t));
	}
	auto mm=std::minmax_element(
		rows.begin(),rows.end(),
		[](const std::pair<double,double>&a,const std::pair<double,double>&b){
			return a.second<b.second;
		});

	OutTgt out=open_out(o.out);
	if(o.cfg.format=="json"){
		JsonWriter w(*out.stream,o.cfg.pretty);
		w.obj_begin();
		put_meta(w,"eot");
		w.field("year",year);
		w.field("order",cal.eot.order);
		w.key("min");
		w.obj_begin();
		w.field("time",fmt_iso(mm.first->first,tz_off,false));
		w.field("eot_min",mm.first->second,10);
		w.obj_end();
		w.key("max");
		w.obj_begin();
		w.field("time",fmt_iso(mm.second->first,tz_off,false));
		w.field("eot_min",mm.second->second,10);
		w.obj_end();
		if(table){
			w.key("data");
			w.arr_begin();
			for(const auto&r : rows){
				w.obj_begin();
				w.field("time",fmt_iso(r.first,tz_off,false));
				w.field("eot_min",r.second,10);
				w.obj_end();
			}
			w.arr_end();
		}
		w.obj_end();
		*out.stream<<"\n";
	}else{
		*out.stream<<"tool=pillar format=txt type=eot year="<<year
				   <<" order="<<cal.eot.order<<"\n";
		if(table){
			for(const auto&r : rows){
				*out.stream<<fmt_iso(r.first,tz_off,false)<<" "
						   <<fmt_num(r.second,4)<<"\n";
			}
		}
		*out.stream<<"min="<<fmt_num(mm.first->second,4)<<" at "
				   <<fmt_iso(mm.first->first,tz_off,false)<<"\n";
		*out.stream<<"max="<<fmt_num(mm.second->second,4)<<" at "
				   <<fmt_iso(mm.second->first,tz_off,false)<<"\n";
	}
	note_out(o.out,o.quiet);
	return 0;
}

int cmd_cfg(const std::vector<std::string>&args){
	if(args.empty()||(args.size()==1&&(args[0]=="-h"||args[0]=="--help"))){
		use_cfg();
		return 0;
	}
	std::string action=to_low(args[0]);
	std::string format="txt";
	std::string out_path;
	bool pretty=true;
	bool quiet=false;

	auto parse_opt=[&](std::size_t start){
		for(std::size_t i=start;i<args.size();++i){
			const std::string&opt=args[i];
			if(opt=="--format"){
				format=to_low(req_val(args,i,opt));
			}else if(opt=="--out"){
				out_path=req_val(args,i,opt);
			}else if(opt=="--pretty"){
				pretty=parse_bool01(req_val(args,i,opt),"--pretty");
			}else if(opt=="--quiet"){
				quiet=true;
			}else{
				throw std::invalid_argument("unknown option for config: "+opt);
			}
		}
	};

	AppCfg cfg;
	load_cfg(cfg);
	if(action=="show"){
		parse_opt(1);
		chk_fmt(format,{"json","txt"},"config show");
		OutTgt out=open_out(out_path);
		if(format=="json"){
			JsonWriter w(*out.stream,pretty);
			w.obj_begin();
			put_meta(w,"config");
			w.key("data");
			w.obj_begin();
			for(const auto&kv : cfg_items(cfg)){
				w.field(kv.first,kv.second);
			}
			w.obj_end();
			w.obj_end();
			*out.stream<<"\n";
		}else{
			*out.stream<<"tool=pillar format=txt type=config\n";
			for(const auto&kv : cfg_items(cfg)){
				*out.stream<<kv.first<<"="<<kv.second<<"\n";
			}
		}
		note_out(out_path,quiet);
		return 0;
	}

	if(action=="set"){
		if(args.size()<3){
			throw std::invalid_argument("config set requires: <key> <value>");
		}
		std::string key=to_low(args[1]);
		parse_opt(3);
		set_key(cfg,key,args[2]);
		if(key=="tz"){
			parse_tz(cfg.tz);
		}
		cfg.pc.validate();
		if(!save_cfg(cfg)){
			throw std::runtime_error("failed to save config: "+CFG_FILE);
		}
		note_out(CFG_FILE,quiet);
		return 0;
	}

	throw std::invalid_argument("config action must be show or set");
}

int run_cli_args(const std::vector<std::string>&args){
	if(args.empty()){
		use_main();
		return 2;
	}

	const std::string&first=args[0];
	std::vector<std::string> rest(args.begin()+1,args.end());

	if(first=="-h"||first=="--help"){
		use_main();
		return 0;
	}
	if(first=="--version"){
		std::cout<<tool_ver()<<std::endl;
		return 0;
	}
	if(first=="at"){
		return cmd_at(rest);
	}
	if(first=="batch"){
		return cmd_batch(rest);
	}
	if(first=="terms"){
		return cmd_terms(rest);
	}
	if(first=="eot"){
		return cmd_eot(rest);
	}
	if(first=="config"){
		return cmd_cfg(rest);
	}
	throw std::invalid_argument("unknown command: "+first);
}

namespace{

void use_common(){
	std::cout
		<<"Common options:\n"
		<<"  --lon <deg>            observer longitude, east positive\n"
		<<"  --meridian <deg>       standard meridian (default: nearest "
		  "multiple of 15)\n"
		<<"  --mean                 mean time at the meridian, no solar "
		  "correction\n"
		<<"  --policy lon:<deg>|date:<m>-<d>\n"
		<<"                         year boundary (default lon:315)\n"
		<<"  --eot-order 0..5       equation of time series order, 0 = from "
		  "provider\n"
		<<"  --tol <deg> --iter N   solar term root-find tolerance and budget\n"
		<<"  --provider series|spice [--ephem <bsp>]\n"
		<<"  --tz Z|+08:00|-05:00   input default and display timezone\n"
		<<"  --format txt|json [--out <path>] [--pretty 0|1] [--quiet]\n";
}

}

void use_at(){
	std::cout<<"Usage:\n"
			 <<"  pillar at <time> --lon <deg> [options]\n"
			 <<"  pillar at --time <time> --lon <deg> [options]\n"
			 <<"Time formats:\n"
			 <<"  YYYY-MM-DD[THH:MM[:SS[.sss]]] with optional Z or +HH:MM\n"
			 <<"  @<unix seconds> or a bare number\n";
	use_common();
	std::cout<<"Example:\n"
			 <<"  pillar at 1949-10-01T15:00+08:00 --lon 116.4 --format json\n";
}

void use_batch(){
	std::cout<<"Usage:\n"
			 <<"  pillar batch --lon <deg> --stdin [--jobs N] [options]\n"
			 <<"  pillar batch --lon <deg> --file <path> [--jobs N] "
			   "[options]\n"
			 <<"One time per line; blank lines and lines starting with # are "
			   "skipped.\n"
			 <<"A failing line is reported on its own; the exit code is 1 if "
			   "any failed.\n";
	use_common();
}

void use_terms(){
	std::cout<<"Usage:\n"
			 <<"  pillar terms <year> [options]\n"
			 <<"Lists the 24 solar terms of a civil year in time order.\n";
	use_common();
}

void use_eot(){
	std::cout<<"Usage:\n"
			 <<"  pillar eot <year> [--step <days>] [--table 0|1] [options]\n"
			 <<"Samples the equation of time (minutes, apparent minus mean) "
			   "over a year\n"
			 <<"and reports its extrema.\n";
	use_common();
}

void use_cfg(){
	std::cout<<"Usage:\n"
			 <<"  pillar config show [--format txt|json] [--out <path>]\n"
			 <<"  pillar config set <key> <value> [--quiet]\n"
			 <<"Keys:\n"
			 <<"  std_meridian solar_correction year_policy eot_order "
			   "root_tol root_iter\n"
			 <<"  term_margin scan_step\n"
			 <<"  ref_epoch ref_day ref_year ref_year_val jie_origin "
			   "jie_branch\n"
			 <<"  month_stems hour_stems eot_from eot_to provider ephem jobs "
			   "format tz pretty\n"
			 <<"Stored in "<<CFG_FILE<<" in the working directory.\n";
}

void use_main(){
	std::cout<<tool_ver()<<"\n"
			 <<"Usage:\n"
			 <<"  pillar at <time> --lon <deg>       four pillars of one "
			   "instant\n"
			 <<"  pillar batch --lon <deg> --stdin   one instant per line\n"
			 <<"  pillar terms <year>                solar terms of a year\n"
			 <<"  pillar eot <year>                  equation of time table\n"
			 <<"  pillar config show|set             stored defaults\n"
			 <<"  pillar --version | -h\n"
			 <<"Run a command with -h for its options.\n";
}
