#pragma once

#include<cstddef>
#include<fstream>
#include<set>
#include<string>
#include<vector>

namespace cli_util{

struct OutTgt{
	std::ofstream file;
	std::ostream*stream=nullptr;
};

bool is_opt(const std::string&s);

std::string to_low(std::string s);

bool parse_bool01(const std::string&text,const std::string&label);

std::string req_val(const std::vector<std::string>&args,std::size_t&idx,
					const std::string&opt);

OutTgt open_out(const std::string&path);

void note_out(const std::string&path,bool quiet);

void chk_fmt(const std::string&format,const std::set<std::string>&allowed,
			 const std::string&ctx);

} // namespace cli_util

std::string tool_ver();

// dispatch on the first argument; returns the process exit code
int run_cli_args(const std::vector<std::string>&args);

int cmd_at(const std::vector<std::string>&args);
int cmd_batch(const std::vector<std::string>&args);
int cmd_terms(const std::vector<std::string>&args);
int cmd_eot(const std::vector<std::string>&args);
int cmd_cfg(const std::vector<std::string>&args);

void use_main();
void use_at();
void use_batch();
void use_terms();
void use_eot();
void use_cfg();
