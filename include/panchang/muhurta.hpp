#pragma once

#include<atomic>
#include<cstddef>
#include<map>
#include<ostream>
#include<string>
#include<vector>

#include "panchang/muh_rules.hpp"
#include "panchang/panchang.hpp"

enum class Tier{ AVOID,POOR,AVERAGE,GOOD,VERY_GOOD,EXCELLENT };

Tier tier_of(int score);

std::string tier_name(Tier t);

// throws std::invalid_argument
Tier parse_tier(const std::string&name);

struct FacScore{
	Factor fac;
	double weight=0.0;
	double fav=0.0;
	std::string value;
	std::string verdict;
};

struct MuhCand{
	double st=0.0;
	double ed=0.0;
	int score=0;
	Tier tier=Tier::AVOID;
	bool excluded=false;
	std::vector<FacScore> factors;
	std::vector<std::string> warnings;
	std::string summary;
};

struct MuhQuery{
	MuhEvent ev=MuhEvent::GENERAL;
	Location loc;
	double jd_from=0.0;
	double jd_to=0.0;
	double step_min=30.0;
	Tier min_tier=Tier::AVOID;
	std::size_t max_res=0;
	AyaSys sys=AyaSys::LAHIRI;
	// caller-supplied busy periods, never sampled
	std::vector<Span> skip;
};

struct MuhSearch{
	std::vector<MuhCand> cands;
	bool partial=false;
	std::size_t n_eval=0;
	std::size_t n_total=0;
	std::string rule_ver;
};

struct MuhDay{
	std::string date;
	double day_start=0.0;
	std::vector<MuhCand> cands;
};

// Source of panchang snapshots for the scorer.
class PanSrc{
public:
	virtual ~PanSrc()=default;

	virtual PanchangResult panchang_at(const Location&loc,const Instant&t,
									   AyaSys sys)=0;
};

struct MuhScorer{
	PanSrc&src;
	int workers;
	double near_min;
	std::ostream*log;

	explicit MuhScorer(PanSrc&s,int w=1,double near=15.0,
					   std::ostream*lg=nullptr);

	// 0..1 from sidereal longitude: exalted, own, debilitated, other
	static double planet_str(Body b,double sid);

	static double fav_of(const FacRule&fr,int v,double neutral);

	static void rank(std::vector<MuhCand>&cands);

	MuhCand score(const MuhRule&rule,const PanchangResult&p,double st,
				  double ed) const;

	MuhCand eval(const MuhRule&rule,const MuhQuery&q,double st,double ed);

	// throws EmptyWindow, InvalidCoordinate, InvalidInstant and the
	// first per-sample failure
	MuhSearch search(const MuhRule&rule,const MuhQuery&q,
					 const std::atomic<bool>*stop=nullptr);

	// highest-ranked non-excluded window; false when none
	bool best(const MuhRule&rule,const MuhQuery&q,MuhCand&out);

	// one entry per local civil day touching [jd_from,jd_to)
	std::vector<MuhDay> calendar(const MuhRule&rule,const MuhQuery&q,
								 std::size_t per_day,
								 const std::atomic<bool>*stop=nullptr);
};
