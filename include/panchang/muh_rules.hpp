#pragma once

#include<map>
#include<set>
#include<string>
#include<vector>

#include "panchang/ephem.hpp"

enum class MuhEvent{ MARRIAGE,BUSINESS,TRAVEL,EDUCATION,PROPERTY,GENERAL };

enum class Factor{ TITHI,NAKSHATRA,YOGA,KARANA,VARA,MOON_PHASE,PLANETS };

// Hard exclusions, checked before any weighting.
enum class Excl{ RAHU_KAAL,GULIKA_KAAL,YAMAGANDA_KAAL,VISHTI_KARANA };

struct FacRule{
	double weight=0.0;
	std::set<int> fav;
	std::set<int> unfav;
};

struct PlanetWt{
	Body body;
	double weight;
};

struct MuhRule{
	MuhEvent ev=MuhEvent::GENERAL;
	std::string name;
	std::string ver;
	std::map<Factor,FacRule> fac;
	std::vector<PlanetWt> planets;
	std::vector<Excl> excl;
	double neutral=0.5;

	bool excludes(Excl x) const;
};

struct RuleSet{
	std::string ver;
	std::map<MuhEvent,MuhRule> rules;

	static RuleSet std_set(const std::string&ver,double neutral=0.5);

	const MuhRule&find(MuhEvent ev) const;
};

const std::vector<MuhEvent>&all_events();
const std::vector<Factor>&all_factors();

std::string event_name(MuhEvent ev);

// throws std::invalid_argument
MuhEvent parse_event(const std::string&name);

std::string factor_name(Factor f);

std::string excl_name(Excl x);
