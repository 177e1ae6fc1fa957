#pragma once

#include<cstddef>
#include<iosfwd>
#include<map>
#include<shared_mutex>
#include<string>
#include<utility>
#include<vector>

#include "pillar/sun_lon.hpp"

constexpr int TERM_COUNT=24;
constexpr double TERM_STEP=15.0;

// A resolved solar-term crossing.
struct TermNode{
	double lon=0.0;
	int year=0;
	double ts=0.0;
	// |longitude - target| at ts, degrees
	double resid=0.0;
	int iters=0;
};

struct RootOpt{
	double tol_deg=1e-6;
	int max_iter=50;
	double scan_days=2.0;
};

// Index 0..23 of a multiple of 15 degrees; RangeError otherwise.
int term_idx(double lon);

// Sectional ("Jie") nodes sit at odd multiples of 15 degrees.
bool is_jie(int idx);

// Mean-motion estimate of the crossing of lon inside civil (UTC) year.
double st_guess(int year,double lon);

struct TermLoc{
	SunLonSrc&src;
	RootOpt opt;

	TermLoc(SunLonSrc&s,const RootOpt&o);

	// signed angular residual in (-180,180]
	double f_sterm(double ts,double tgt);

	// the single crossing of tgt inside [t_lo,t_hi)
	TermNode locate(double tgt,double t_lo,double t_hi);

  private:
	struct Bracket{
		double a;
		double b;
		double fa;
		double fb;
	};

	TermNode refine(double tgt,const Bracket&br);
};

// Read-mostly node cache keyed by (term index, year). Inserts are
// first-wins so concurrent first computations of one key agree. A cache
// serves one provider and solver setting; bind() records it and rejects
// any other with InvalidCombination.
class TermCache{
  public:
	void bind(const std::string&tag);

	bool get(int idx,int year,TermNode&out) const;

	TermNode put(int idx,const TermNode&node);

	std::size_t size() const;

	// drops the nodes and the binding
	void clear();

  private:
	mutable std::shared_mutex mtx_;
	std::string tag_;
	std::map<std::pair<int,int>,TermNode> map_;
};

struct SolTerms{
	TermLoc loc;
	TermCache&cache;
	double margin_days;

	SolTerms(SunLonSrc&s,const RootOpt&o,TermCache&c,double margin);

	TermNode get_st(double lon,int year);

	// all 24 nodes of a civil year sorted by time; failures land in errors
	std::vector<TermNode> year_terms(int year,std::ostream*log,
									 std::vector<std::string>*errors=nullptr);
};
