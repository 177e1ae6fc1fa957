#pragma once

#include<atomic>
#include<cstddef>
#include<vector>

struct PillarCal;
struct ConvItem;

struct BatchCtx{
	PillarCal*self;
	const std::vector<double>*ts;
	double lon;
	std::vector<ConvItem>*results;
	std::atomic<std::size_t>*cursor;
};

void run_wkr(BatchCtx*ctx);

void conv_one(PillarCal&cal,double ts,double lon,ConvItem&out);
