#include "pillar/spc_ephem.hpp"

#include<filesystem>
#include<stdexcept>

#include "pillar/errors.hpp"

extern "C"{
#include "SpiceUsr.h"
}

namespace fs=std::filesystem;

std::set<std::string> EphRead::load_paths;

std::mutex&EphRead::spice_mtx(){
	static std::mutex mtx;
	return mtx;
}

EphRead::EphRead(const std::string&path) : filepath(path){
	if(filepath.empty()){
		throw ProviderFailure("ephemeris path is empty");
	}
	SSB=0;
	SUN=10;
	EARTH=399;

	id_name[SSB]="SOLAR SYSTEM BARYCENTER";
	id_name[SUN]="SUN";
	id_name[EARTH]="EARTH";

	load_kern();
}

void EphRead::load_kern(){
	std::lock_guard<std::mutex> lock(spice_mtx());
	cfg_spice();

	if(load_paths.find(filepath)!=load_paths.end()){
		return;
	}

	std::error_code ec;
	if(!fs::exists(filepath,ec)){
		throw ProviderFailure("ephemeris file not found: "+filepath);
	}
	auto fsize=fs::file_size(filepath,ec);
	if(ec||fsize==0){
		throw ProviderFailure("ephemeris file is not readable or empty: "+
							  filepath);
	}

	furnsh_c(filepath.c_str());
	chk_spice("failed to load ephemeris kernel "+filepath);

	SpiceInt count=0;
	ktotal_c("SPK",&count);
	chk_spice("failed to query loaded SPK kernels");
	if(count==0){
		throw ProviderFailure("no SPK kernels loaded from "+filepath);
	}
	load_paths.insert(filepath);
}

std::string EphRead::to_name(int code) const{
	auto it=id_name.find(code);
	if(it==id_name.end()){
		throw ProviderFailure("unknown target/observer code "+
							  std::to_string(code));
	}
	return it->second;
}

double EphRead::et_fromjd(double jd_tdb){ return (jd_tdb-JD_J2000)*SEC_DAY; }

std::pair<Vec3,Vec3> EphRead::get_state(int target,int observer,
										double jd_tdb){
	std::string tname=to_name(target);
	std::string oname=to_name(observer);
	double et=et_fromjd(jd_tdb);
	SpiceDouble state[6];
	SpiceDouble lt;
	{
		std::lock_guard<std::mutex> lock(spice_mtx());
		spkezr_c(tname.c_str(),et,"J2000","NONE",oname.c_str(),state,&lt);
		chk_spice("spkezr_c failed for "+tname+" from "+oname);
	}
	Vec3 pos(state[0]/AU_KM,state[1]/AU_KM,state[2]/AU_KM);
	Vec3 vel(state[3]*(SEC_DAY/AU_KM),state[4]*(SEC_DAY/AU_KM),
			 state[5]*(SEC_DAY/AU_KM));
	return {pos,vel};
}

Vec3 EphRead::get_pos(int target,int observer,double jd_tdb){
	return get_state(target,observer,jd_tdb).first;
}

// callers hold spice_mtx()
void chk_spice(const std::string&context){
	if(!failed_c()){
		return;
	}

	SpiceChar msg[1841];
	getmsg_c("LONG",sizeof(msg),msg);
	reset_c();
	throw ProviderFailure(context+": "+std::string(msg));
}

void cfg_spice(){
	static std::once_flag flag;
	std::call_once(flag,[](){
		SpiceChar action[]="RETURN";
		SpiceChar detail[]="SHORT,EXPLAIN";
		erract_c("SET",0,action);
		errprt_c("SET",0,detail);
	});
}
