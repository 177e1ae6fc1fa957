#include "pillar/c_api.h"

#include<exception>
#include<stdexcept>
#include<string>
#include<vector>

#include "pillar/cli.hpp"
#include "pillar/errors.hpp"
#include "pillar/pillar.hpp"

namespace{

thread_local std::string g_last_error;

void set_err(const std::string&msg){
	g_last_error=msg;
}

void clr_err(){
	g_last_error.clear();
}

std::vector<std::string> mk_args(int argc,const char*const*argv){
	if(argc<0){
		throw std::invalid_argument("argc must be >= 0");
	}
	if(argc>0&&argv==nullptr){
		throw std::invalid_argument("argv must not be null when argc > 0");
	}

	std::vector<std::string> out;
	out.reserve(static_cast<std::size_t>(argc));
	for(int i=0;i<argc;++i){
		if(argv[i]==nullptr){
			throw std::invalid_argument("argv contains null entry");
		}
		out.emplace_back(argv[i]);
	}
	return out;
}

int kind_code(ErrKind kind){
	switch(kind){
	case ErrKind::NONE:
		return PILLAR_OK;
	case ErrKind::RANGE:
		return PILLAR_ERR_RANGE;
	case ErrKind::COMBO:
		return PILLAR_ERR_COMBO;
	case ErrKind::CONVERGE:
		return PILLAR_ERR_CONVERGE;
	case ErrKind::AMBIGUOUS:
		return PILLAR_ERR_AMBIGUOUS;
	case ErrKind::OUT_OF_RANGE:
		return PILLAR_ERR_OUT_OF_RANGE;
	case ErrKind::PROVIDER:
		return PILLAR_ERR_PROVIDER;
	case ErrKind::OTHER:
		break;
	}
	return PILLAR_ERR_OTHER;
}

template<typename Fn>
int guard(Fn&&fn){
	clr_err();
	try{
		return fn();
	}catch(const PillarError&ex){
		set_err(ex.what());
		return kind_code(ex.kind);
	}catch(const std::invalid_argument&ex){
		set_err(ex.what());
		return PILLAR_ERR_RANGE;
	}catch(const std::exception&ex){
		set_err(ex.what());
		return PILLAR_ERR_OTHER;
	}
}

// one series provider and calendar per thread, reused across calls
PillarCal&tl_cal(){
	thread_local SeriesSun src;
	thread_local PillarCal cal(src,PillarCfg());
	return cal;
}

}

extern "C"{

const char*PILLAR_CALL pillar_tool_ver(void){
	static thread_local std::string ver;
	ver=tool_ver();
	return ver.c_str();
}

const char*PILLAR_CALL pillar_last_error(void){
	return g_last_error.empty()?nullptr:g_last_error.c_str();
}

void PILLAR_CALL pillar_clear_error(void){
	clr_err();
}

int PILLAR_CALL pillar_run(int argc,const char*const*argv){
	clr_err();
	try{
		std::vector<std::string> args=mk_args(argc,argv);
		return run_cli_args(args);
	}catch(const std::invalid_argument&ex){
		set_err(ex.what());
		return 2;
	}catch(const std::exception&ex){
		set_err(ex.what());
		return 1;
	}
}

int PILLAR_CALL pillar_convert(double ts,double lon,int out_values[4],
							   double*out_offset_min){
	return guard([&](){
		if(out_values==nullptr){
			throw std::invalid_argument("out_values must not be null");
		}
		CoordSet c=tl_cal().convert(ts,lon);
		out_values[0]=c.year.value();
		out_values[1]=c.month.value();
		out_values[2]=c.day.value();
		out_values[3]=c.hour.value();
		if(out_offset_min!=nullptr){
			*out_offset_min=c.offset_min;
		}
		return PILLAR_OK;
	});
}

}
