#include "panchang/muhurta.hpp"

#include<algorithm>
#include<cmath>
#include<exception>
#include<iomanip>
#include<sstream>
#include<stdexcept>
#include<thread>

#include "panchang/errors.hpp"
#include "panchang/smp_wkr.hpp"

namespace{

constexpr std::size_t kMaxWork=32;

const int GANDA_MOOLA[]={0,8,9,17,18,26};

struct Dignity{
	Body body;
	int exalt;
	std::vector<int> own;
};

const std::vector<Dignity>&dignities(){
	static const std::vector<Dignity> v={
		{Body::SUN,0,{4}},		   {Body::MOON,1,{3}},
		{Body::MARS,9,{0,7}},	   {Body::MERCURY,5,{2,5}},
		{Body::JUPITER,3,{8,11}},  {Body::VENUS,11,{1,6}},
		{Body::SATURN,6,{9,10}},
	};
	return v;
}

std::string verdict_of(double fav,double neutral){
	if(fav>neutral){
		return "helped";
	}
	if(fav<neutral){
		return "hurt";
	}
	return "neutral";
}

std::string day_label(double day_start,int off){
	CivilDT c=CivilDT::from_utc(day_start+0.5/MIN_DAY,off);
	std::ostringstream oss;
	oss<<std::setfill('0')<<std::setw(4)<<c.year<<"-"<<std::setw(2)<<c.month
	   <<"-"<<std::setw(2)<<c.day;
	return oss.str();
}

void chk_kaal(const Span&k,const std::string&name,bool excl,double st,
			  double ed,double margin,MuhCand&c){
	if(k.len()<=0.0){
		return;
	}
	if(k.overlaps(st,ed)){
		if(excl){
			c.excluded=true;
			c.warnings.push_back("window overlaps "+name+" (excluded)");
		}else{
			c.warnings.push_back("window overlaps "+name);
		}
		return;
	}
	for(double b : {k.st,k.ed}){
		if(std::fabs(st-b)<margin||std::fabs(ed-b)<margin){
			c.warnings.push_back("window within "+
								 std::to_string(static_cast<int>(
									 std::lround(margin*MIN_DAY)))+
								 " min of "+name+" boundary");
			return;
		}
	}
}

std::string summary_of(const MuhCand&c){
	std::ostringstream oss;
	oss<<tier_name(c.tier)<<" ("<<c.score<<")";
	if(c.excluded){
		oss<<": hard exclusion";
		return oss.str();
	}
	std::string up;
	std::string down;
	for(const auto&f : c.factors){
		if(f.verdict=="neutral"){
			continue;
		}
		std::string&dst=f.verdict=="helped"?up:down;
		dst+=(dst.empty()?"":", ")+factor_name(f.fac);
	}
	if(!up.empty()){
		oss<<"; helped by "<<up;
	}
	if(!down.empty()){
		oss<<"; hurt by "<<down;
	}
	return oss.str();
}

}

Tier tier_of(int score){
	if(score>=80){
		return Tier::EXCELLENT;
	}
	if(score>=70){
		return Tier::VERY_GOOD;
	}
	if(score>=60){
		return Tier::GOOD;
	}
	if(score>=50){
		return Tier::AVERAGE;
	}
	if(score>=40){
		return Tier::POOR;
	}
	return Tier::AVOID;
}

std::string tier_name(Tier t){
	switch(t){
	case Tier::AVOID:
		return "Avoid";
	case Tier::POOR:
		return "Poor";
	case Tier::AVERAGE:
		return "Average";
	case Tier::GOOD:
		return "Good";
	case Tier::VERY_GOOD:
		return "Very Good";
	case Tier::EXCELLENT:
		return "Excellent";
	}
	return "?";
}

Tier parse_tier(const std::string&name){
	for(Tier t : {Tier::AVOID,Tier::POOR,Tier::AVERAGE,Tier::GOOD,
				  Tier::VERY_GOOD,Tier::EXCELLENT}){
		if(tier_name(t)==name){
			return t;
		}
	}
	throw std::invalid_argument("unknown quality tier '"+name+"'");
}

MuhScorer::MuhScorer(PanSrc&s,int w,double near,std::ostream*lg)
	: src(s),workers(w),near_min(near),log(lg){}

double MuhScorer::planet_str(Body b,double sid){
	int r=static_cast<int>(std::floor(norm360(sid)/30.0))%12;
	for(const auto&d : dignities()){
		if(d.body!=b){
			continue;
		}
		if(r==d.exalt){
			return 1.0;
		}
		if(std::find(d.own.begin(),d.own.end(),r)!=d.own.end()){
			return 0.8;
		}
		if(r==(d.exalt+6)%12){
			return 0.2;
		}
		return 0.5;
	}
	return 0.5;
}

double MuhScorer::fav_of(const FacRule&fr,int v,double neutral){
	if(fr.fav.count(v)){
		return 1.0;
	}
	if(fr.unfav.count(v)){
		return 0.0;
	}
	return neutral;
}

void MuhScorer::rank(std::vector<MuhCand>&cands){
	std::stable_sort(cands.begin(),cands.end(),
					 [](const MuhCand&a,const MuhCand&b){
						 if(a.score!=b.score){
							 return a.score>b.score;
						 }
						 return a.st<b.st;
					 });
}

MuhCand MuhScorer::score(const MuhRule&rule,const PanchangResult&p,double st,
						 double ed) const{
	MuhCand c;
	c.st=st;
	c.ed=ed;
	double margin=near_min/MIN_DAY;

	chk_kaal(p.rahu,"Rahu Kaal",rule.excludes(Excl::RAHU_KAAL),st,ed,margin,c);
	chk_kaal(p.gulika,"Gulika Kaal",rule.excludes(Excl::GULIKA_KAAL),st,ed,
			 margin,c);
	chk_kaal(p.yama,"Yamaganda Kaal",rule.excludes(Excl::YAMAGANDA_KAAL),st,
			 ed,margin,c);
	if(p.karana.name=="Vishti"&&rule.excludes(Excl::VISHTI_KARANA)){
		c.excluded=true;
		c.warnings.push_back("Vishti karana (excluded)");
	}
	for(int g : GANDA_MOOLA){
		if(p.nak.idx==g){
			c.warnings.push_back("Ganda Moola nakshatra "+p.nak.name);
		}
	}
	if(p.panchaka){
		c.warnings.push_back("Panchaka ("+p.panchaka_kind+")");
	}

	if(c.excluded){
		c.score=0;
		c.tier=Tier::AVOID;
		c.summary=summary_of(c);
		return c;
	}

	double wsum=0.0;
	double acc=0.0;
	for(Factor f : all_factors()){
		auto it=rule.fac.find(f);
		if(it==rule.fac.end()||it->second.weight<=0.0){
			continue;
		}
		const FacRule&fr=it->second;
		FacScore fs;
		fs.fac=f;
		fs.weight=fr.weight;
		switch(f){
		case Factor::TITHI:
			fs.fav=fav_of(fr,p.tithi.idx+1,rule.neutral);
			fs.value=p.tithi.name;
			break;
		case Factor::NAKSHATRA:
			fs.fav=fav_of(fr,p.nak.idx,rule.neutral);
			fs.value=p.nak.name;
			break;
		case Factor::YOGA:
			fs.fav=fav_of(fr,p.yoga.idx,rule.neutral);
			fs.value=p.yoga.name;
			break;
		case Factor::KARANA:
			fs.fav=fav_of(fr,p.karana.kind,rule.neutral);
			fs.value=p.karana.name;
			break;
		case Factor::VARA:
			fs.fav=fav_of(fr,p.vara.idx,rule.neutral);
			fs.value=p.vara.name;
			break;
		case Factor::MOON_PHASE:
			fs.fav=fav_of(fr,p.phase.idx,rule.neutral);
			fs.value=p.phase.name;
			break;
		case Factor::PLANETS:{
			double pw=0.0;
			double ps=0.0;
			std::string names;
			for(const auto&pl : rule.planets){
				for(const auto&g : p.grahas){
					if(g.name!=body_name(pl.body)){
						continue;
					}
					pw+=pl.weight;
					ps+=pl.weight*planet_str(pl.body,g.sid);
					names+=(names.empty()?"":", ")+g.name+" in "+g.rashi_name;
				}
			}
			fs.fav=pw>0.0?ps/pw:rule.neutral;
			fs.value=names;
			break;
		}
		}
		fs.verdict=verdict_of(fs.fav,rule.neutral);
		wsum+=fs.weight;
		acc+=fs.weight*fs.fav;
		c.factors.push_back(fs);
	}
	double norm=wsum>0.0?acc/wsum:rule.neutral;
	c.score=static_cast<int>(std::lround(100.0*norm));
	c.score=std::max(0,std::min(100,c.score));
	c.tier=tier_of(c.score);
	c.summary=summary_of(c);
	return c;
}

MuhCand MuhScorer::eval(const MuhRule&rule,const MuhQuery&q,double st,
						double ed){
	PanchangResult p=src.panchang_at(q.loc,Instant::from_utc(st),q.sys);
	return score(rule,p,st,ed);
}

MuhSearch MuhScorer::search(const MuhRule&rule,const MuhQuery&q,
							const std::atomic<bool>*stop){
	q.loc.validate();
	Instant::from_utc(q.jd_from);
	Instant::from_utc(q.jd_to);
	ErrCtx ctx;
	ctx.jd_utc=q.jd_from;
	ctx.lat=q.loc.lat;
	ctx.lon=q.loc.lon;
	if(!(q.step_min>0.0)){
		throw CalcError(ErrKind::EMPTY_WINDOW,"step must be positive",ctx);
	}
	double step=q.step_min/MIN_DAY;
	double n_f=std::floor((q.jd_to-q.jd_from)/step+1e-9);
	if(!(n_f>=1.0)){
		throw CalcError(ErrKind::EMPTY_WINDOW,
						"range shorter than one step of "+
							std::to_string(q.step_min)+" min",
						ctx);
	}
	std::size_t n=static_cast<std::size_t>(n_f);

	std::vector<SmpTask> tasks;
	tasks.reserve(n);
	for(std::size_t k=0;k<n;++k){
		double st=q.jd_from+static_cast<double>(k)*step;
		double ed=st+step;
		bool busy=false;
		for(const auto&s : q.skip){
			if(s.overlaps(st,ed)){
				busy=true;
				break;
			}
		}
		if(!busy){
			tasks.push_back({st,ed});
		}
	}

	MuhSearch out;
	out.rule_ver=rule.ver;
	out.n_total=tasks.size();
	std::vector<MuhCand> results(tasks.size());
	std::vector<char> done(tasks.size(),0);
	std::vector<std::exception_ptr> errors(tasks.size());
	std::atomic<std::size_t> cursor{0};
	SmpCtx sc{this,&rule,&q,&tasks,&results,&done,&errors,&cursor,stop};

	std::size_t wk_count=workers>0?static_cast<std::size_t>(workers):0;
	if(wk_count==0){
		unsigned int hc=std::thread::hardware_concurrency();
		wk_count=hc==0?4:static_cast<std::size_t>(hc);
	}
	wk_count=std::min<std::size_t>(wk_count,tasks.size());
	wk_count=std::min<std::size_t>(wk_count,kMaxWork);
	if(log){
		(*log)<<"[muhurta] "<<rule.name<<" rules v"<<rule.ver<<": "
			  <<tasks.size()<<" samples of "<<q.step_min<<" min on "
			  <<std::max<std::size_t>(wk_count,1)<<" worker(s)"<<std::endl;
	}
	if(wk_count<=1){
		run_wkr(&sc);
	}else{
		std::vector<std::thread> pool;
		for(std::size_t i=0;i<wk_count;++i){
			pool.emplace_back(run_wkr,&sc);
		}
		for(auto&th : pool){
			th.join();
		}
	}

	for(std::size_t i=0;i<tasks.size();++i){
		if(errors[i]){
			std::rethrow_exception(errors[i]);
		}
	}
	for(std::size_t i=0;i<tasks.size();++i){
		if(done[i]){
			++out.n_eval;
			out.cands.push_back(std::move(results[i]));
		}
	}
	out.partial=out.n_eval<out.n_total;
	if(out.partial&&log){
		(*log)<<"[muhurta] stopped after "<<out.n_eval<<"/"<<out.n_total
			  <<" samples"<<std::endl;
	}

	rank(out.cands);
	out.cands.erase(std::remove_if(out.cands.begin(),out.cands.end(),
								   [&](const MuhCand&c){
									   return c.tier<q.min_tier;
								   }),
					out.cands.end());
	if(q.max_res>0&&out.cands.size()>q.max_res){
		out.cands.resize(q.max_res);
	}
	return out;
}

bool MuhScorer::best(const MuhRule&rule,const MuhQuery&q,MuhCand&out){
	MuhQuery bq=q;
	bq.max_res=0;
	MuhSearch s=search(rule,bq);
	for(const auto&c : s.cands){
		if(!c.excluded&&c.tier!=Tier::AVOID){
			out=c;
			return true;
		}
	}
	return false;
}

std::vector<MuhDay> MuhScorer::calendar(const MuhRule&rule,const MuhQuery&q,
										std::size_t per_day,
										const std::atomic<bool>*stop){
	q.loc.validate();
	int off=q.loc.utc_off();
	Instant::from_utc(q.jd_from);
	Instant::from_utc(q.jd_to);
	if(!(q.jd_to>q.jd_from)){
		ErrCtx ctx;
		ctx.jd_utc=q.jd_from;
		ctx.lat=q.loc.lat;
		ctx.lon=q.loc.lon;
		throw CalcError(ErrKind::EMPTY_WINDOW,"empty calendar range",ctx);
	}
	double step=q.step_min/MIN_DAY;
	std::vector<MuhDay> days;
	double ds=CivilDT::from_utc(q.jd_from,off).day_start();
	while(ds<q.jd_to){
		if(stop&&stop->load()){
			break;
		}
		MuhQuery dq=q;
		dq.jd_from=std::max(ds,q.jd_from);
		dq.jd_to=std::min(ds+1.0,q.jd_to);
		dq.max_res=per_day;
		MuhDay d;
		d.date=day_label(ds,off);
		d.day_start=ds;
		if(!(step>0.0)||std::floor((dq.jd_to-dq.jd_from)/step+1e-9)>=1.0){
			d.cands=search(rule,dq,stop).cands;
		}
		days.push_back(d);
		ds+=1.0;
	}
	return days;
}
