#pragma once

#include<ostream>
#include<string>
#include<vector>

#include "panchang/ayanamsha.hpp"
#include "panchang/ephem.hpp"
#include "panchang/res_cache.hpp"

constexpr double NAK_SPAN=360.0/27.0;
constexpr double TITHI_SPAN=12.0;

enum class Paksha{ SHUKLA,KRISHNA };

// UTC Julian dates, [st,ed)
struct Span{
	double st=0.0;
	double ed=0.0;

	double len() const{ return ed-st; }
	bool contains(double jd) const{ return jd>=st&&jd<ed; }
	bool overlaps(double a,double b) const{ return a<ed&&b>st; }
};

struct TithiInf{
	double value=0.0;
	int idx=0;
	int num=1;
	Paksha paksha=Paksha::SHUKLA;
	std::string name;
	double end_jd=0.0;
};

struct NakInf{
	int idx=0;
	std::string name;
	std::string lord;
	int pada=1;
	double end_jd=0.0;
};

struct YogaInf{
	int idx=0;
	std::string name;
	double end_jd=0.0;
};

struct KarInf{
	int idx=0;
	int kind=0;
	std::string name;
};

struct VaraInf{
	int idx=0;
	std::string name;
};

struct MoonPh{
	int idx=0;
	std::string name;
	double elong=0.0;
	double illum=0.0;
};

struct GrahaPos{
	std::string name;
	double trop=0.0;
	double sid=0.0;
	int rashi=0;
	std::string rashi_name;
	int nak=0;
	std::string nak_name;
};

// Disha Shool of the vara and the Moon's nivas.
struct ShoolInf{
	std::string dir;
	std::string deity;
	std::string fav_dir;
	std::string nivas;
};

// Tarabala counted from birth_nak; chandrabala from the tithi.
struct TaraInf{
	int birth_nak=0;
	int num=1;
	std::string name;
	std::string result;
	int chandra_pts=0;
	std::string chandra;
};

struct HinduYears{
	int vikram=0;
	int shaka=0;
	int kali=0;
};

// Sun/Moon events of one local civil day.
struct DaySpan{
	double day_start=0.0;
	double sunrise=0.0;
	double sunset=0.0;
	double noon=0.0;
	double moonrise=0.0;
	double moonset=0.0;
	bool has_moonrise=true;
	bool has_moonset=true;
	// civil twilight, Sun at -6 deg
	double dawn=0.0;
	double dusk=0.0;
	bool has_dawn=true;
	bool has_dusk=true;
};

// Elements that follow from the two sidereal longitudes alone.
struct PanElems{
	TithiInf tithi;
	NakInf nak;
	YogaInf yoga;
	KarInf karana;
	MoonPh phase;
	int sun_rashi=0;
	int moon_rashi=0;
};

struct PanchangResult{
	double jd_utc=0.0;
	Location loc;
	AyaSys sys=AyaSys::LAHIRI;
	double aya_deg=0.0;
	bool aya_extrap=false;
	double sun_sid=0.0;
	double moon_sid=0.0;

	TithiInf tithi;
	NakInf nak;
	YogaInf yoga;
	KarInf karana;
	VaraInf vara;
	MoonPh phase;

	double sunrise=0.0;
	double sunset=0.0;
	double noon=0.0;
	double day_len_h=0.0;
	double moonrise=0.0;
	double moonset=0.0;
	bool has_moonrise=true;
	bool has_moonset=true;
	double dawn=0.0;
	double dusk=0.0;
	bool has_dawn=true;
	bool has_dusk=true;

	Span rahu;
	Span gulika;
	Span yama;
	Span brahma;
	Span abhijit;

	int sun_rashi=0;
	int moon_rashi=0;
	std::string ritu;
	std::vector<GrahaPos> grahas;
	HinduYears years;
	bool panchaka=false;
	std::string panchaka_kind;
	double lst_h=0.0;
	double lmt_h=0.0;
	ShoolInf shool;
	TaraInf tara;
	std::vector<std::string> warnings;
};

// 60-slot karana cycle.
struct KarTab{
	std::vector<std::string> names;
	std::vector<int> slots;

	static KarTab std_tab();

	int kind(int slot) const;
	const std::string&name(int slot) const;
	int find(const std::string&n) const;
};

namespace pan_tab{

const std::string&tithi_name(int idx);
const std::string&nak_name(int idx);
const std::string&nak_lord(int idx);
const std::string&yoga_name(int idx);
const std::string&vara_name(int wday);
const std::string&phase_name(int idx);
const std::string&rashi_name(int idx);
const std::string&ritu_name(int idx);

int nak_find(const std::string&n);
int yoga_find(const std::string&n);

// rahu, gulika, yamaganda segment (0..7) by weekday, Sunday=0
int rahu_seg(int wday);
int gulika_seg(int wday);
int yama_seg(int wday);

}

struct PanDeriv{
	EphemProv&eph;
	const AyaEng&aya;
	KarTab kar;
	ResCache<DaySpan>*day_cache;
	std::ostream*log;
	// janma nakshatra for tarabala, Rohini unless set
	int birth_nak=3;

	PanDeriv(EphemProv&e,const AyaEng&a,ResCache<DaySpan>*dc=nullptr,
			 std::ostream*lg=nullptr);

	static PanElems elems(double sun_sid,double moon_sid,const KarTab&kt);

	static MoonPh phase_of(double elong);

	// kaal span from segment index 0..7 of [rise,set)
	static Span kaal(double rise,double set,int seg);

	static HinduYears years_of(int year,int month);

	static double rahu_node(double jc);

	static ShoolInf shool_of(int wday,double moon_sid);

	static TaraInf tara_of(int birth_nak,int nak_idx,int tithi_idx);

	// local mean time in hours from the longitude
	static double lmt_hours(double jd_utc,double lon);

	DaySpan day_span(const Location&loc,double day_start);

	// throws InvalidCoordinate, EphemerisUnavailable, NoRiseOrSet
	PanchangResult derive(double sun_sid,double moon_sid,const Instant&t,
						  const Location&loc,AyaSys sys);

	double sun_sid_at(double jd_utc,AyaSys sys);
	double moon_sid_at(double jd_utc,AyaSys sys);

	// End times of the element holding the given longitudes at t. The
	// provider's motion is shifted to pass through those longitudes.
	double tithi_end(const Instant&t,double elong);
	double nak_end(const Instant&t,double moon_sid,AyaSys sys);
	double yoga_end(const Instant&t,double sum_sid,AyaSys sys);
};
