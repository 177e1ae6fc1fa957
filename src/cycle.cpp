#include "pillar/cycle.hpp"

#include<sstream>

#include "pillar/errors.hpp"
#include "pillar/math.hpp"

SexaUnit SexaUnit::from_val(int v){
	if(v<0||v>=CYCLE){
		throw RangeError("sexagenary value out of [0,59]: "+std::to_string(v));
	}
	return SexaUnit(v);
}

SexaUnit SexaUnit::from_sb(int stem,int branch){
	if(stem<0||stem>=STEMS){
		throw RangeError("stem out of [0,9]: "+std::to_string(stem));
	}
	if(branch<0||branch>=BRANCHES){
		throw RangeError("branch out of [0,11]: "+std::to_string(branch));
	}
	if(stem%2!=branch%2){
		throw InvalidCombination("stem "+std::to_string(stem)+" and branch "+
								 std::to_string(branch)+" differ in parity");
	}
	// walk the branch residue class until the stem matches
	for(int v=branch;v<CYCLE;v+=BRANCHES){
		if(v%STEMS==stem){
			return SexaUnit(v);
		}
	}
	throw InvalidCombination("no cycle value for stem "+std::to_string(stem)+
							 " branch "+std::to_string(branch));
}

SexaUnit SexaUnit::advance(long k) const{
	return SexaUnit(static_cast<int>(floor_mod(val_+k%CYCLE,CYCLE)));
}

int SexaUnit::dist_to(const SexaUnit&other) const{
	return static_cast<int>(floor_mod(other.val_-val_,CYCLE));
}

std::string fmt_unit(const SexaUnit&u){
	std::ostringstream oss;
	oss<<u.value()<<"("<<u.stem()<<","<<u.branch()<<")";
	return oss.str();
}
