#include "pillar/batch.hpp"

#include<exception>

#include "pillar/pillar.hpp"

void conv_one(PillarCal&cal,double ts,double lon,ConvItem&out){
	try{
		out.coord.emplace(cal.convert(ts,lon));
		out.kind=ErrKind::NONE;
		out.error.clear();
	}catch(const PillarError&ex){
		out.kind=ex.kind;
		out.error=ex.what();
	}catch(const std::exception&ex){
		out.kind=ErrKind::OTHER;
		out.error=ex.what();
	}
}

void run_wkr(BatchCtx*ctx){
	std::size_t idx;
	while((idx=ctx->cursor->fetch_add(1))<ctx->ts->size()){
		conv_one(*ctx->self,ctx->ts->at(idx),ctx->lon,ctx->results->at(idx));
	}
}
