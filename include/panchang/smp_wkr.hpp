#pragma once

#include<atomic>
#include<cstddef>
#include<exception>
#include<vector>

struct MuhScorer;
struct MuhRule;
struct MuhQuery;
struct MuhCand;

struct SmpTask{
	double st;
	double ed;
};

struct SmpCtx{
	MuhScorer*self;
	const MuhRule*rule;
	const MuhQuery*query;
	const std::vector<SmpTask>*tasks;
	std::vector<MuhCand>*results;
	std::vector<char>*done;
	std::vector<std::exception_ptr>*errors;
	std::atomic<std::size_t>*cursor;
	const std::atomic<bool>*stop;
};

void run_wkr(SmpCtx*ctx);
