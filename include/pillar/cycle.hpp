#pragma once

#include<string>

constexpr int CYCLE=60;
constexpr int STEMS=10;
constexpr int BRANCHES=12;

// One value of the sexagenary cycle. Only constructible through the
// validating factories, so stem%2==branch%2 always holds.
class SexaUnit{
  public:
	static SexaUnit from_val(int v);

	static SexaUnit from_sb(int stem,int branch);

	int value() const{ return val_; }
	int stem() const{ return val_%STEMS; }
	int branch() const{ return val_%BRANCHES; }

	SexaUnit advance(long k) const;

	// forward steps from this to other, in [0,59]
	int dist_to(const SexaUnit&other) const;

	bool operator==(const SexaUnit&b) const{ return val_==b.val_; }
	bool operator!=(const SexaUnit&b) const{ return val_!=b.val_; }

  private:
	explicit SexaUnit(int v) : val_(v){}

	int val_;
};

std::string fmt_unit(const SexaUnit&u);
