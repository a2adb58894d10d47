#include "panchang/engine.hpp"

#include "panchang/math.hpp"

namespace{

AyaSys chk_sys(const EngCfg&cfg){
	chk_cfg(cfg);
	return AyaEng::parse(cfg.default_aya);
}

}

PanEngine::PanEngine(const EngCfg&cfg,EphemProv&eph,std::ostream*log)
	: cfg_(cfg),
	  eph_(eph),
	  log_(log),
	  aya_(),
	  def_sys_(chk_sys(cfg)),
	  rules_(RuleSet::std_set(cfg.rule_ver,cfg.neutral_fav)),
	  aya_cache_(cfg.aya_cap,cfg.aya_ttl),
	  day_cache_(cfg.day_cap,cfg.day_ttl),
	  pan_cache_(cfg.pan_cap,cfg.pan_ttl),
	  muh_cache_(cfg.muh_cap,cfg.muh_ttl),
	  deriv_(eph,aya_,&day_cache_,log),
	  scorer_(*this,cfg.workers,cfg.near_min,log){
	if(log_){
		(*log_)<<"[engine] provider "<<eph_.name()<<", default ayanamsha "
			   <<AyaEng::code(def_sys_)<<", rules v"<<rules_.ver<<std::endl;
	}
}

AyaVal PanEngine::aya_at(AyaSys sys,const Instant&t){
	std::string key=KeyBld("aya").add(AyaEng::code(sys)).add(t.jd_tt).str();
	return aya_cache_.get_or(key,[&](){ return aya_.value(sys,t); });
}

PanchangResult PanEngine::panchang_at(const Location&loc,const Instant&t,
									  AyaSys sys){
	loc.validate();
	Instant::from_utc(t.jd_utc);
	std::string key=KeyBld("pan")
						.add(eph_.name())
						.add(loc.lat)
						.add(loc.lon)
						.add(loc.elev)
						.add(loc.utc_off())
						.add(AyaEng::code(sys))
						.add(t.jd_utc)
						.str();
	return pan_cache_.get_or(key,[&](){
		AyaVal av=aya_at(sys,t);
		double sun=norm360(eph_.get_longitude(Body::SUN,t)-av.deg);
		double moon=norm360(eph_.get_longitude(Body::MOON,t)-av.deg);
		return deriv_.derive(sun,moon,t,loc,sys);
	});
}

Res<PanchangResult> PanEngine::compute_panchang(const Location&loc,
												const Instant&t,AyaSys sys){
	return guard_res<PanchangResult>([&](){ return panchang_at(loc,t,sys); });
}

Res<PanchangResult> PanEngine::compute_panchang(const Location&loc,
												const Instant&t){
	return compute_panchang(loc,t,def_sys_);
}

Res<AyaVal> PanEngine::ayanamsha(AyaSys sys,const Instant&t){
	return guard_res<AyaVal>([&](){
		Instant::from_utc(t.jd_utc);
		return aya_at(sys,t);
	});
}

Res<std::map<AyaSys,AyaVal>> PanEngine::compare_ayanamsha(const Instant&t){
	return guard_res<std::map<AyaSys,AyaVal>>([&](){
		Instant::from_utc(t.jd_utc);
		std::map<AyaSys,AyaVal> out;
		for(AyaSys s : AyaEng::all_sys()){
			out[s]=aya_at(s,t);
		}
		return out;
	});
}

std::string PanEngine::muh_key(const MuhQuery&q) const{
	KeyBld kb("muh");
	kb.add(rules_.ver)
		.add(event_name(q.ev))
		.add(eph_.name())
		.add(q.loc.lat)
		.add(q.loc.lon)
		.add(q.loc.elev)
		.add(q.loc.utc_off())
		.add(q.jd_from)
		.add(q.jd_to)
		.add(q.step_min)
		.add(static_cast<int>(q.min_tier))
		.add(static_cast<int>(q.max_res))
		.add(AyaEng::code(q.sys));
	for(const auto&s : q.skip){
		kb.add(s.st).add(s.ed);
	}
	return kb.str();
}

Res<MuhSearch> PanEngine::find_muhurta(MuhEvent ev,const Location&loc,
									   double jd_from,double jd_to,
									   double step_min,Tier min_tier,
									   std::size_t max_res,
									   const std::atomic<bool>*stop){
	MuhQuery q;
	q.ev=ev;
	q.loc=loc;
	q.jd_from=jd_from;
	q.jd_to=jd_to;
	q.step_min=step_min;
	q.min_tier=min_tier;
	q.max_res=max_res;
	q.sys=def_sys_;
	return find_muhurta(q,stop);
}

Res<MuhSearch> PanEngine::find_muhurta(const MuhQuery&q,
									   const std::atomic<bool>*stop){
	return guard_res<MuhSearch>([&](){
		const MuhRule&rule=rules_.find(q.ev);
		std::string key=muh_key(q);
		if(!stop){
			return muh_cache_.get_or(key,
									 [&](){ return scorer_.search(rule,q); });
		}
		MuhSearch hit;
		if(muh_cache_.get(key,hit)){
			return hit;
		}
		MuhSearch s=scorer_.search(rule,q,stop);
		if(!s.partial){
			muh_cache_.put(key,s);
		}
		return s;
	});
}

Res<std::optional<MuhCand>> PanEngine::best_muhurta(const MuhQuery&q){
	return guard_res<std::optional<MuhCand>>([&](){
		MuhCand c;
		if(scorer_.best(rules_.find(q.ev),q,c)){
			return std::optional<MuhCand>(c);
		}
		return std::optional<MuhCand>();
	});
}

Res<std::vector<MuhDay>> PanEngine::muhurta_calendar(
	const MuhQuery&q,std::size_t per_day,const std::atomic<bool>*stop){
	return guard_res<std::vector<MuhDay>>([&](){
		return scorer_.calendar(rules_.find(q.ev),q,per_day,stop);
	});
}

std::map<std::string,CacheStats> PanEngine::cache_stats() const{
	std::map<std::string,CacheStats> out;
	out["ayanamsha"]=aya_cache_.stats();
	out["day"]=day_cache_.stats();
	out["panchang"]=pan_cache_.stats();
	out["muhurta"]=muh_cache_.stats();
	return out;
}

void PanEngine::clear_caches(){
	aya_cache_.clear();
	day_cache_.clear();
	pan_cache_.clear();
	muh_cache_.clear();
	if(log_){
		(*log_)<<"[engine] caches cleared"<<std::endl;
	}
}
