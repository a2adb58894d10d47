#pragma once

#include<atomic>
#include<cstddef>
#include<map>
#include<optional>
#include<ostream>
#include<string>
#include<vector>

#include "panchang/ayanamsha.hpp"
#include "panchang/config.hpp"
#include "panchang/errors.hpp"
#include "panchang/muh_rules.hpp"
#include "panchang/muhurta.hpp"
#include "panchang/panchang.hpp"
#include "panchang/res_cache.hpp"

// Public entry point. Every operation folds CalcError into Res<T>.
class PanEngine : public PanSrc{
public:
	PanEngine(const EngCfg&cfg,EphemProv&eph,std::ostream*log=nullptr);

	PanEngine(const PanEngine&)=delete;
	PanEngine&operator=(const PanEngine&)=delete;

	Res<PanchangResult> compute_panchang(const Location&loc,const Instant&t,
										 AyaSys sys);
	Res<PanchangResult> compute_panchang(const Location&loc,const Instant&t);

	Res<AyaVal> ayanamsha(AyaSys sys,const Instant&t);

	Res<std::map<AyaSys,AyaVal>> compare_ayanamsha(const Instant&t);

	Res<MuhSearch> find_muhurta(MuhEvent ev,const Location&loc,double jd_from,
								double jd_to,double step_min=30.0,
								Tier min_tier=Tier::AVOID,
								std::size_t max_res=0,
								const std::atomic<bool>*stop=nullptr);
	Res<MuhSearch> find_muhurta(const MuhQuery&q,
								const std::atomic<bool>*stop=nullptr);

	// empty value when every window is Avoid
	Res<std::optional<MuhCand>> best_muhurta(const MuhQuery&q);

	Res<std::vector<MuhDay>> muhurta_calendar(const MuhQuery&q,
											  std::size_t per_day=3,
											  const std::atomic<bool>*stop=
												  nullptr);

	std::map<std::string,CacheStats> cache_stats() const;

	void clear_caches();

	// throws CalcError
	PanchangResult panchang_at(const Location&loc,const Instant&t,
							   AyaSys sys) override;

	AyaSys default_sys() const{ return def_sys_; }
	const RuleSet&rules() const{ return rules_; }
	const EngCfg&cfg() const{ return cfg_; }

private:
	AyaVal aya_at(AyaSys sys,const Instant&t);

	std::string muh_key(const MuhQuery&q) const;

	EngCfg cfg_;
	EphemProv&eph_;
	std::ostream*log_;
	AyaEng aya_;
	AyaSys def_sys_;
	RuleSet rules_;
	ResCache<AyaVal> aya_cache_;
	ResCache<DaySpan> day_cache_;
	ResCache<PanchangResult> pan_cache_;
	ResCache<MuhSearch> muh_cache_;
	PanDeriv deriv_;
	MuhScorer scorer_;
};
