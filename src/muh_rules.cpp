#include "panchang/muh_rules.hpp"

#include<algorithm>
#include<cctype>
#include<stdexcept>

#include "panchang/panchang.hpp"

namespace{

enum Wd{ SUN_D,MON_D,TUE_D,WED_D,THU_D,FRI_D,SAT_D };

// paksha tithi numbers 1..14 in both halves
std::set<int> both(std::initializer_list<int> nums){
	std::set<int> out;
	for(int n : nums){
		out.insert(n);
		out.insert(n+15);
	}
	return out;
}

std::set<int> naks(std::initializer_list<const char*> names){
	std::set<int> out;
	for(const char*n : names){
		int idx=pan_tab::nak_find(n);
		if(idx<0){
			throw std::invalid_argument(std::string("unknown nakshatra ")+n);
		}
		out.insert(idx);
	}
	return out;
}

std::set<int> yogas(std::initializer_list<const char*> names){
	std::set<int> out;
	for(const char*n : names){
		int idx=pan_tab::yoga_find(n);
		if(idx<0){
			throw std::invalid_argument(std::string("unknown yoga ")+n);
		}
		out.insert(idx);
	}
	return out;
}

std::set<int> karanas(std::initializer_list<const char*> names){
	KarTab kt=KarTab::std_tab();
	std::set<int> out;
	for(const char*n : names){
		int idx=kt.find(n);
		if(idx<0){
			throw std::invalid_argument(std::string("unknown karana ")+n);
		}
		out.insert(idx);
	}
	return out;
}

MuhRule base_rule(MuhEvent ev,const std::string&ver,double neutral){
	MuhRule r;
	r.ev=ev;
	r.name=event_name(ev);
	r.ver=ver;
	r.neutral=neutral;
	r.fac[Factor::TITHI].weight=0.15;
	r.fac[Factor::NAKSHATRA].weight=0.15;
	r.fac[Factor::YOGA].weight=0.10;
	r.fac[Factor::KARANA].weight=0.10;
	r.fac[Factor::VARA].weight=0.10;
	r.fac[Factor::MOON_PHASE].weight=0.10;
	r.fac[Factor::PLANETS].weight=0.15;

	r.fac[Factor::YOGA].fav=
		yogas({"Siddha","Sadhya","Shubha","Shukla","Brahma","Indra"});
	r.fac[Factor::YOGA].unfav=
		yogas({"Vishkambha","Atiganda","Shula","Ganda","Vyaghata","Vajra",
			   "Vyatipata","Parigha","Vaidhriti"});
	r.fac[Factor::KARANA].fav=
		karanas({"Bava","Balava","Kaulava","Taitila","Gara","Vanija"});
	r.fac[Factor::KARANA].unfav=
		karanas({"Vishti","Shakuni","Chatushpada","Naga"});
	r.fac[Factor::VARA].unfav={TUE_D,SAT_D};
	r.fac[Factor::MOON_PHASE].unfav={0};
	r.excl.push_back(Excl::RAHU_KAAL);
	return r;
}

}

bool MuhRule::excludes(Excl x) const{
	return std::find(excl.begin(),excl.end(),x)!=excl.end();
}

RuleSet RuleSet::std_set(const std::string&ver,double neutral){
	RuleSet rs;
	rs.ver=ver;
	std::set<int> avoid_t=both({1,4,6,8,9,14});
	avoid_t.insert(15);
	avoid_t.insert(30);
	std::set<int> avoid_n=naks({"Bharani","Ashlesha","Jyeshtha","Mula"});

	MuhRule m=base_rule(MuhEvent::MARRIAGE,ver,neutral);
	m.fac[Factor::TITHI].fav=both({2,3,5,7,10,11,12,13});
	m.fac[Factor::TITHI].unfav=avoid_t;
	m.fac[Factor::NAKSHATRA].fav=
		naks({"Rohini","Mrigashira","Magha","Uttara Phalguni","Hasta","Swati",
			  "Anuradha","Uttara Ashadha","Uttara Bhadrapada"});
	m.fac[Factor::NAKSHATRA].unfav=avoid_n;
	m.fac[Factor::VARA].fav={SUN_D,MON_D,WED_D,THU_D,FRI_D};
	m.fac[Factor::MOON_PHASE].fav={2,3,4};
	m.planets={{Body::VENUS,15.0},{Body::JUPITER,15.0}};
	m.excl.push_back(Excl::YAMAGANDA_KAAL);
	m.excl.push_back(Excl::VISHTI_KARANA);
	rs.rules[m.ev]=m;

	MuhRule b=base_rule(MuhEvent::BUSINESS,ver,neutral);
	b.fac[Factor::TITHI].fav=both({2,3,5,7,10,11,13});
	b.fac[Factor::TITHI].unfav=avoid_t;
	b.fac[Factor::NAKSHATRA].fav=
		naks({"Ashwini","Rohini","Pushya","Magha","Uttara Phalguni","Hasta",
			  "Chitra","Swati","Anuradha","Uttara Ashadha","Shravana",
			  "Dhanishta","Shatabhisha"});
	b.fac[Factor::NAKSHATRA].unfav=avoid_n;
	b.fac[Factor::VARA].fav={SUN_D,MON_D,WED_D,THU_D};
	b.fac[Factor::MOON_PHASE].fav={2,3,4};
	b.planets={{Body::MERCURY,10.0},
			   {Body::JUPITER,15.0},
			   {Body::VENUS,10.0},
			   {Body::MOON,10.0}};
	rs.rules[b.ev]=b;

	MuhRule t=base_rule(MuhEvent::TRAVEL,ver,neutral);
	t.fac[Factor::TITHI].fav=both({2,3,5,6,7,10,11,12,13});
	t.fac[Factor::TITHI].unfav=both({1,4,8,9,14});
	t.fac[Factor::TITHI].unfav.insert(15);
	t.fac[Factor::TITHI].unfav.insert(30);
	t.fac[Factor::NAKSHATRA].fav=
		naks({"Ashwini","Rohini","Mrigashira","Punarvasu","Pushya","Hasta",
			  "Chitra","Swati","Anuradha","Shravana","Dhanishta",
			  "Shatabhisha"});
	t.fac[Factor::NAKSHATRA].unfav=avoid_n;
	t.fac[Factor::VARA].fav={MON_D,WED_D,THU_D,FRI_D};
	t.fac[Factor::MOON_PHASE].fav={2,6};
	t.planets={{Body::MOON,10.0},{Body::MERCURY,10.0}};
	rs.rules[t.ev]=t;

	MuhRule e=base_rule(MuhEvent::EDUCATION,ver,neutral);
	e.fac[Factor::TITHI].fav=both({2,3,5,7,10,11,12,13});
	e.fac[Factor::TITHI].unfav=avoid_t;
	e.fac[Factor::NAKSHATRA].fav=
		naks({"Ashwini","Rohini","Punarvasu","Pushya","Hasta","Chitra",
			  "Swati","Anuradha","Uttara Ashadha","Shravana","Dhanishta",
			  "Revati"});
	e.fac[Factor::NAKSHATRA].unfav=avoid_n;
	e.fac[Factor::VARA].fav={MON_D,WED_D,THU_D,FRI_D};
	e.fac[Factor::MOON_PHASE].fav={1,2,3,4};
	e.planets={{Body::MERCURY,20.0},{Body::JUPITER,15.0}};
	rs.rules[e.ev]=e;

	MuhRule p=base_rule(MuhEvent::PROPERTY,ver,neutral);
	p.fac[Factor::TITHI].fav=both({2,3,5,7,10,11,12,13});
	p.fac[Factor::TITHI].unfav=avoid_t;
	p.fac[Factor::NAKSHATRA].fav=
		naks({"Rohini","Mrigashira","Pushya","Magha","Uttara Phalguni","Hasta",
			  "Chitra","Swati","Anuradha","Uttara Ashadha","Shravana",
			  "Uttara Bhadrapada"});
	p.fac[Factor::NAKSHATRA].unfav=avoid_n;
	p.fac[Factor::VARA].fav={SUN_D,MON_D,WED_D,THU_D,FRI_D};
	p.fac[Factor::MOON_PHASE].fav={1,2,3,4};
	p.fac[Factor::MOON_PHASE].unfav={0,7};
	p.planets={{Body::MARS,15.0},{Body::VENUS,10.0},{Body::MOON,10.0}};
	p.excl.push_back(Excl::GULIKA_KAAL);
	p.excl.push_back(Excl::YAMAGANDA_KAAL);
	p.excl.push_back(Excl::VISHTI_KARANA);
	rs.rules[p.ev]=p;

	MuhRule g=b;
	g.ev=MuhEvent::GENERAL;
	g.name=event_name(MuhEvent::GENERAL);
	g.fac[Factor::MOON_PHASE].fav={1,2,3,4};
	g.planets={{Body::JUPITER,15.0},{Body::MOON,10.0}};
	rs.rules[g.ev]=g;
	return rs;
}

const MuhRule&RuleSet::find(MuhEvent ev) const{
	auto it=rules.find(ev);
	if(it==rules.end()){
		throw std::invalid_argument("no rule for event "+event_name(ev));
	}
	return it->second;
}

const std::vector<MuhEvent>&all_events(){
	static const std::vector<MuhEvent> v={
		MuhEvent::MARRIAGE,MuhEvent::BUSINESS,MuhEvent::TRAVEL,
		MuhEvent::EDUCATION,MuhEvent::PROPERTY,MuhEvent::GENERAL,
	};
	return v;
}

const std::vector<Factor>&all_factors(){
	static const std::vector<Factor> v={
		Factor::TITHI,Factor::NAKSHATRA,Factor::YOGA,Factor::KARANA,
		Factor::VARA,Factor::MOON_PHASE,Factor::PLANETS,
	};
	return v;
}

std::string event_name(MuhEvent ev){
	switch(ev){
	case MuhEvent::MARRIAGE:
		return "marriage";
	case MuhEvent::BUSINESS:
		return "business";
	case MuhEvent::TRAVEL:
		return "travel";
	case MuhEvent::EDUCATION:
		return "education";
	case MuhEvent::PROPERTY:
		return "property";
	case MuhEvent::GENERAL:
		return "general";
	}
	return "?";
}

MuhEvent parse_event(const std::string&name){
	std::string low;
	for(char c : name){
		unsigned char u=static_cast<unsigned char>(c);
		low.push_back(static_cast<char>(std::tolower(u)));
	}
	for(MuhEvent ev : all_events()){
		if(event_name(ev)==low){
			return ev;
		}
	}
	throw std::invalid_argument("unknown muhurta event '"+name+"'");
}

std::string factor_name(Factor f){
	switch(f){
	case Factor::TITHI:
		return "tithi";
	case Factor::NAKSHATRA:
		return "nakshatra";
	case Factor::YOGA:
		return "yoga";
	case Factor::KARANA:
		return "karana";
	case Factor::VARA:
		return "vara";
	case Factor::MOON_PHASE:
		return "moon phase";
	case Factor::PLANETS:
		return "planets";
	}
	return "?";
}

std::string excl_name(Excl x){
	switch(x){
	case Excl::RAHU_KAAL:
		return "Rahu Kaal";
	case Excl::GULIKA_KAAL:
		return "Gulika Kaal";
	case Excl::YAMAGANDA_KAAL:
		return "Yamaganda Kaal";
	case Excl::VISHTI_KARANA:
		return "Vishti karana";
	}
	return "?";
}
