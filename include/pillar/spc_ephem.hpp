#pragma once

#include<map>
#include<mutex>
#include<set>
#include<string>
#include<utility>

#include "pillar/math.hpp"

void cfg_spice();
void chk_spice(const std::string&context);

// SPK kernel access. CSPICE keeps global state, every call made through
// an EphRead is serialized on spice_mtx().
struct EphRead{
	std::string filepath;
	int SSB;
	int SUN;
	int EARTH;
	std::map<int,std::string> id_name;

	explicit EphRead(const std::string&path);

	void load_kern();

	std::string to_name(int code) const;

	static double et_fromjd(double jd_tdb);

	// AU and AU/day, ICRF, geometric
	std::pair<Vec3,Vec3> get_state(int target,int observer,double jd_tdb);

	Vec3 get_pos(int target,int observer,double jd_tdb);

	static std::mutex&spice_mtx();

  private:
	static std::set<std::string> load_paths;
};
