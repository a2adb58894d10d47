#include "panchang/smp_wkr.hpp"

#include "panchang/muhurta.hpp"

void run_wkr(SmpCtx*ctx){
	std::size_t idx;
	while((idx=ctx->cursor->fetch_add(1))<ctx->tasks->size()){
		if(ctx->stop&&ctx->stop->load()){
			return;
		}
		const auto&task=ctx->tasks->at(idx);
		try{
			ctx->results->at(idx)=
				ctx->self->eval(*ctx->rule,*ctx->query,task.st,task.ed);
			ctx->done->at(idx)=1;
		}catch(const std::exception&){
			ctx->errors->at(idx)=std::current_exception();
		}
	}
}
