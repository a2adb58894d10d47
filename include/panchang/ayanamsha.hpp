#pragma once

#include<map>
#include<string>
#include<utility>
#include<vector>

#include "panchang/time_scale.hpp"

enum class AyaSys{
	LAHIRI,
	RAMAN,
	KRISHNAMURTI,
	YUKTESHWAR,
	SURYASIDDHANTA,
	FAGAN_BRADLEY,
	DELUCE,
	PUSHYA_PAKSHA,
	GALACTIC_CENTER,
	TRUE_CITRA,
};

enum class AyaModel{ LINEAR,IAU2006 };

// One reference row. Rates are arcsec per Julian year.
struct AyaDef{
	AyaSys sys;
	std::string code;
	std::string desc;
	double epoch_jd;
	double base_deg;
	AyaModel model;
	double rate_as;
	double yr_lo;
	double yr_hi;
};

struct AyaVal{
	AyaSys sys=AyaSys::LAHIRI;
	double deg=0.0;
	bool extrap=false;
};

struct AyaTab{
	std::vector<AyaDef> rows;

	static AyaTab std_tab();

	const AyaDef&find(AyaSys sys) const;
};

struct AyaEng{
	AyaTab tab;

	AyaEng();
	explicit AyaEng(AyaTab t);

	static const std::vector<AyaSys>&all_sys();

	// throws UnknownAyanamshaSystem
	static AyaSys parse(const std::string&name);

	static std::string code(AyaSys sys);

	AyaVal value(AyaSys sys,const Instant&t) const;

	std::map<AyaSys,AyaVal> compare_all(const Instant&t) const;

	double to_sidereal(double trop,AyaSys sys,const Instant&t) const;

	double to_tropical(double sid,AyaSys sys,const Instant&t) const;

	const AyaDef&info(AyaSys sys) const;

	double diff(AyaSys a,AyaSys b,const Instant&t) const;

	std::vector<std::pair<int,AyaVal>> series(AyaSys sys,int from_year,
											  int to_year,int step=10) const;

	// degrees at a TT Julian date, without range handling
	static double eval(const AyaDef&d,double jd_tt);

	// degrees per Julian year
	static double rate(const AyaDef&d,double jd_tt);
};
