#pragma once

#include<memory>
#include<string>
#include<utility>
#include<vector>

#include "pillar/pillar.hpp"
#include "pillar/sun_lon.hpp"

struct AppCfg{
	PillarCfg pc;
	std::string provider="series";
	std::string ephem;
	int jobs=1;
	std::string format="txt";
	std::string tz="Z";
	bool pretty=true;
};

extern const std::string CFG_FILE;

std::string trim(const std::string&s);

int parse_int(const std::string&text,const std::string&label);

double parse_num(const std::string&text,const std::string&label);

YearPolicy parse_policy(const std::string&text);

std::string fmt_policy(const YearPolicy&p);

// throws std::invalid_argument on an unknown key or a malformed value
void set_key(AppCfg&cfg,const std::string&key,const std::string&value);

std::vector<std::pair<std::string,std::string>> cfg_items(const AppCfg&cfg);

// false when the file does not exist
bool load_cfg(AppCfg&cfg,const std::string&path=CFG_FILE);

bool save_cfg(const AppCfg&cfg,const std::string&path=CFG_FILE);

std::unique_ptr<SunLonSrc> make_src(const AppCfg&cfg);
