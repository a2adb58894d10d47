#include "panchang/panchang.hpp"

#include<algorithm>
#include<cmath>

#include "panchang/errors.hpp"
#include "panchang/frames.hpp"
#include "panchang/rise_set.hpp"

namespace{

const std::vector<std::string> TITHI={
	"Shukla Pratipad","Shukla Dwitiya","Shukla Tritiya","Shukla Chaturthi",
	"Shukla Panchami","Shukla Shashthi","Shukla Saptami","Shukla Ashtami",
	"Shukla Navami","Shukla Dashami","Shukla Ekadashi","Shukla Dwadashi",
	"Shukla Trayodashi","Shukla Chaturdashi","Purnima",
	"Krishna Pratipad","Krishna Dwitiya","Krishna Tritiya","Krishna Chaturthi",
	"Krishna Panchami","Krishna Shashthi","Krishna Saptami","Krishna Ashtami",
	"Krishna Navami","Krishna Dashami","Krishna Ekadashi","Krishna Dwadashi",
	"Krishna Trayodashi","Krishna Chaturdashi","Amavasya",
};

const std::vector<std::string> NAK={
	"Ashwini","Bharani","Krittika","Rohini","Mrigashira","Ardra",
	"Punarvasu","Pushya","Ashlesha","Magha","Purva Phalguni",
	"Uttara Phalguni","Hasta","Chitra","Swati","Vishakha","Anuradha",
	"Jyeshtha","Mula","Purva Ashadha","Uttara Ashadha","Shravana",
	"Dhanishta","Shatabhisha","Purva Bhadrapada","Uttara Bhadrapada",
	"Revati",
};

// Vimshottari order, repeating every nine nakshatras
const std::vector<std::string> LORD={
	"Ketu","Venus","Sun","Moon","Mars","Rahu","Jupiter","Saturn","Mercury",
};

const std::vector<std::string> YOGA={
	"Vishkambha","Priti","Ayushman","Saubhagya","Shobhana","Atiganda",
	"Sukarma","Dhriti","Shula","Ganda","Vriddhi","Dhruva","Vyaghata",
	"Harshana","Vajra","Siddhi","Vyatipata","Variyan","Parigha","Shiva",
	"Siddha","Sadhya","Shubha","Shukla","Brahma","Indra","Vaidhriti",
};

const std::vector<std::string> VARA={
	"Ravivara","Somavara","Mangalavara","Budhavara","Guruvara",
	"Shukravara","Shanivara",
};

const std::vector<std::string> PHASE={
	"New Moon","Waxing Crescent","First Quarter","Waxing Gibbous",
	"Full Moon","Waning Gibbous","Last Quarter","Waning Crescent",
};

const std::vector<std::string> RASHI={
	"Mesha","Vrishabha","Mithuna","Karka","Simha","Kanya","Tula",
	"Vrishchika","Dhanu","Makara","Kumbha","Meena",
};

const std::vector<std::string> RITU={
	"Vasanta","Grishma","Varsha","Sharad","Hemanta","Shishira",
};

const std::vector<std::string> PANCHAKA={
	"Agni","Raja","Mrityu","Chor","Roga",
};

// Sunday first
const std::vector<std::string> SHOOL={
	"South","North","East","South","West","North","East",
};

const std::vector<std::string> NIVAS={
	"Ksheera Sagara","Vaikuntha","Ksheer Sagara","Bhu Loka","Patala Loka",
	"Swarga Loka",
};

const std::vector<std::string> TARA={
	"Janma","Sampat","Vipat","Kshema","Pratyak","Sadhaka","Vadha","Mitra",
	"Param Mitra",
};

const std::vector<std::string> TARA_RES={
	"Neutral","Very Good","Bad","Good","Bad","Good","Very Bad","Very Good",
	"Excellent",
};

const std::vector<std::string> CHANDRA={
	"Very Weak","Weak","Average","Good","Very Good","Excellent","Supreme",
};

std::string dir_deity(const std::string&dir){
	if(dir=="North"){
		return "Kubera";
	}
	if(dir=="East"){
		return "Indra";
	}
	if(dir=="South"){
		return "Yama";
	}
	return "Varuna";
}

std::string dir_opp(const std::string&dir){
	if(dir=="North"){
		return "South";
	}
	if(dir=="South"){
		return "North";
	}
	if(dir=="East"){
		return "West";
	}
	return "East";
}

constexpr double TWI_H0=-6.0;

const int RAHU_SEG[7]={7,1,6,4,5,3,2};
const int GULIKA_SEG[7]={6,5,4,3,2,1,0};
const int YAMA_SEG[7]={4,3,2,1,0,6,5};

int clamp_idx(double v,int n){
	int i=static_cast<int>(std::floor(v));
	if(i<0){
		i=0;
	}
	if(i>=n){
		i=n-1;
	}
	return i;
}

int find_name(const std::vector<std::string>&tab,const std::string&n){
	for(std::size_t i=0;i<tab.size();++i){
		if(tab[i]==n){
			return static_cast<int>(i);
		}
	}
	return -1;
}

const std::string&at_mod(const std::vector<std::string>&tab,int idx){
	int n=static_cast<int>(tab.size());
	return tab[static_cast<std::size_t>(((idx%n)+n)%n)];
}

// First jd>=jd0 where f changes from negative to non-negative. f must be a
// wrapped angle difference that is negative just before the boundary.
template<typename Fn>
double cross_fwd(Fn&&f,double jd0,double step,double limit){
	double a=jd0;
	double fa=f(a);
	if(fa>=0.0){
		return a;
	}
	for(double b=jd0+step;b<=jd0+limit+1e-9;b+=step){
		double fb=f(b);
		if(fb>=0.0){
			for(int i=0;i<50&&b-a>1e-7;++i){
				double m=0.5*(a+b);
				if(f(m)>=0.0){
					b=m;
				}else{
					a=m;
				}
			}
			return 0.5*(a+b);
		}
		a=b;
	}
	ErrCtx ctx;
	ctx.jd_utc=jd0;
	throw CalcError(ErrKind::EPHEM_UNAVAIL,"element boundary not reached",ctx);
}

void chk_lon(double v,const char*what,const Instant&t){
	if(!std::isfinite(v)){
		ErrCtx ctx;
		ctx.jd_utc=t.jd_utc;
		ctx.body=what;
		throw CalcError(ErrKind::EPHEM_UNAVAIL,
						std::string("non-finite longitude for ")+what,ctx);
	}
}

}

namespace pan_tab{

const std::string&tithi_name(int idx){ return at_mod(TITHI,idx); }
const std::string&nak_name(int idx){ return at_mod(NAK,idx); }
const std::string&nak_lord(int idx){ return at_mod(LORD,idx); }
const std::string&yoga_name(int idx){ return at_mod(YOGA,idx); }
const std::string&vara_name(int wday){ return at_mod(VARA,wday); }
const std::string&phase_name(int idx){ return at_mod(PHASE,idx); }
const std::string&rashi_name(int idx){ return at_mod(RASHI,idx); }
const std::string&ritu_name(int idx){ return at_mod(RITU,idx); }

int nak_find(const std::string&n){ return find_name(NAK,n); }
int yoga_find(const std::string&n){ return find_name(YOGA,n); }

int rahu_seg(int wday){ return RAHU_SEG[((wday%7)+7)%7]; }
int gulika_seg(int wday){ return GULIKA_SEG[((wday%7)+7)%7]; }
int yama_seg(int wday){ return YAMA_SEG[((wday%7)+7)%7]; }

}

KarTab KarTab::std_tab(){
	KarTab t;
	t.names={"Bava","Balava","Kaulava","Taitila","Gara","Vanija","Vishti",
			 "Shakuni","Chatushpada","Naga","Kimstughna"};
	t.slots.assign(60,0);
	t.slots[0]=10;
	for(int i=1;i<=56;++i){
		t.slots[static_cast<std::size_t>(i)]=(i-1)%7;
	}
	t.slots[57]=7;
	t.slots[58]=8;
	t.slots[59]=9;
	return t;
}

int KarTab::kind(int slot) const{
	int n=static_cast<int>(slots.size());
	return slots[static_cast<std::size_t>(((slot%n)+n)%n)];
}

const std::string&KarTab::name(int slot) const{
	return names[static_cast<std::size_t>(kind(slot))];
}

int KarTab::find(const std::string&n) const{ return find_name(names,n); }

PanDeriv::PanDeriv(EphemProv&e,const AyaEng&a,ResCache<DaySpan>*dc,
				   std::ostream*lg)
	: eph(e),aya(a),kar(KarTab::std_tab()),day_cache(dc),log(lg){}

MoonPh PanDeriv::phase_of(double elong){
	MoonPh p;
	p.elong=norm360(elong);
	p.idx=static_cast<int>(std::floor((p.elong+22.5)/45.0))%8;
	p.name=pan_tab::phase_name(p.idx);
	p.illum=(1.0-std::cos(p.elong*DEG2RAD))/2.0*100.0;
	return p;
}

PanElems PanDeriv::elems(double sun_sid,double moon_sid,const KarTab&kt){
	double sun=norm360(sun_sid);
	double moon=norm360(moon_sid);
	double elong=norm360(moon-sun);

	PanElems e;
	e.tithi.value=elong/TITHI_SPAN;
	e.tithi.idx=clamp_idx(e.tithi.value,30);
	e.tithi.num=e.tithi.idx+1;
	e.tithi.paksha=e.tithi.num<=15?Paksha::SHUKLA:Paksha::KRISHNA;
	e.tithi.name=pan_tab::tithi_name(e.tithi.idx);

	e.nak.idx=clamp_idx(moon/NAK_SPAN,27);
	e.nak.name=pan_tab::nak_name(e.nak.idx);
	e.nak.lord=pan_tab::nak_lord(e.nak.idx);
	e.nak.pada=clamp_idx((moon-e.nak.idx*NAK_SPAN)/(NAK_SPAN/4.0),4)+1;

	e.yoga.idx=clamp_idx(norm360(sun+moon)/NAK_SPAN,27);
	e.yoga.name=pan_tab::yoga_name(e.yoga.idx);

	e.karana.idx=static_cast<int>(std::floor(e.tithi.value*2.0))%60;
	e.karana.kind=kt.kind(e.karana.idx);
	e.karana.name=kt.name(e.karana.idx);

	e.phase=phase_of(elong);
	e.sun_rashi=clamp_idx(sun/30.0,12);
	e.moon_rashi=clamp_idx(moon/30.0,12);
	return e;
}

Span PanDeriv::kaal(double rise,double set,int seg){
	double part=(set-rise)/8.0;
	Span s;
	s.st=rise+seg*part;
	s.ed=seg==7?set:rise+(seg+1)*part;
	return s;
}

HinduYears PanDeriv::years_of(int year,int month){
	HinduYears y;
	y.vikram=month>=4?year+57:year+56;
	y.shaka=month>=3?year-78:year-79;
	y.kali=year+3102;
	return y;
}

double PanDeriv::rahu_node(double jc){
	return norm360(125.0445479-1934.1362891*jc+0.0020754*jc*jc);
}

ShoolInf PanDeriv::shool_of(int wday,double moon_sid){
	ShoolInf s;
	s.dir=at_mod(SHOOL,wday);
	s.deity=dir_deity(s.dir);
	s.fav_dir=dir_opp(s.dir);
	s.nivas=at_mod(NIVAS,clamp_idx(norm360(moon_sid)/30.0,12));
	return s;
}

TaraInf PanDeriv::tara_of(int birth_nak,int nak_idx,int tithi_idx){
	TaraInf t;
	t.birth_nak=((birth_nak%27)+27)%27;
	int cnt=((nak_idx-t.birth_nak)%27+27)%27;
	t.num=cnt%9+1;
	t.name=TARA[static_cast<std::size_t>(t.num-1)];
	t.result=TARA_RES[static_cast<std::size_t>(t.num-1)];
	t.chandra_pts=std::min(6,((tithi_idx%8)+8)%8);
	t.chandra=CHANDRA[static_cast<std::size_t>(t.chandra_pts)];
	return t;
}

double PanDeriv::lmt_hours(double jd_utc,double lon){
	double h=(jd_utc+0.5-std::floor(jd_utc+0.5))*24.0+lon/15.0;
	h=std::fmod(h,24.0);
	return h<0.0?h+24.0:h;
}

DaySpan PanDeriv::day_span(const Location&loc,double day_start){
	auto calc=[&]() -> DaySpan{
		RsSolver rs(eph,loc);
		DaySpan d;
		d.day_start=day_start;
		double h_sun=RsSolver::sun_h0(loc.elev);
		d.sunrise=rs.find({Body::SUN,true,day_start,1.0,h_sun,true},log);
		d.sunset=rs.find({Body::SUN,false,d.sunrise,1.0,h_sun,false},log);
		d.noon=0.5*(d.sunrise+d.sunset);

		double hp=eph.hor_parallax(Body::MOON,Instant::from_utc(day_start+0.5));
		double h_moon=RsSolver::moon_h0(hp,loc.elev);
		d.has_moonrise=rs.try_find({Body::MOON,true,day_start,1.0,h_moon,false},
								   d.moonrise,log);
		d.has_moonset=rs.try_find({Body::MOON,false,day_start,1.0,h_moon,false},
								  d.moonset,log);
		d.has_dawn=rs.try_find({Body::SUN,true,day_start,1.0,TWI_H0,false},
							   d.dawn,log);
		d.has_dusk=rs.try_find({Body::SUN,false,d.sunset,1.0,TWI_H0,false},
							   d.dusk,log);
		if(log){
			int off=loc.utc_off();
			(*log)<<"[panchang] sunrise "
				  <<fmt_civil(CivilDT::from_utc(d.sunrise,off))<<" sunset "
				  <<fmt_civil(CivilDT::from_utc(d.sunset,off))<<std::endl;
		}
		return d;
	};
	if(!day_cache){
		return calc();
	}
	std::string key=KeyBld("day")
						.add(eph.name())
						.add(loc.lat)
						.add(loc.lon)
						.add(loc.elev)
						.add(day_start)
						.str();
	return day_cache->get_or(key,calc);
}

double PanDeriv::sun_sid_at(double jd_utc,AyaSys sys){
	Instant t=Instant::from_utc(jd_utc);
	return aya.to_sidereal(eph.get_longitude(Body::SUN,t),sys,t);
}

double PanDeriv::moon_sid_at(double jd_utc,AyaSys sys){
	Instant t=Instant::from_utc(jd_utc);
	return aya.to_sidereal(eph.get_longitude(Body::MOON,t),sys,t);
}

double PanDeriv::tithi_end(const Instant&t,double elong){
	double el0=norm360(elong);
	double target=(std::floor(el0/TITHI_SPAN)+1.0)*TITHI_SPAN;
	auto el_at=[&](double jd){
		Instant u=Instant::from_utc(jd);
		return norm360(eph.get_longitude(Body::MOON,u)-
					   eph.get_longitude(Body::SUN,u));
	};
	double shift=norm180(el0-el_at(t.jd_utc));
	auto f=[&](double jd){ return norm180(el_at(jd)+shift-target); };
	return cross_fwd(f,t.jd_utc,0.25,3.0);
}

double PanDeriv::nak_end(const Instant&t,double moon_sid,AyaSys sys){
	double m0=norm360(moon_sid);
	double target=(std::floor(m0/NAK_SPAN)+1.0)*NAK_SPAN;
	double shift=norm180(m0-moon_sid_at(t.jd_utc,sys));
	auto f=[&](double jd){
		return norm180(moon_sid_at(jd,sys)+shift-target);
	};
	return cross_fwd(f,t.jd_utc,0.25,3.0);
}

double PanDeriv::yoga_end(const Instant&t,double sum_sid,AyaSys sys){
	auto sum_at=[&](double jd){
		return norm360(sun_sid_at(jd,sys)+moon_sid_at(jd,sys));
	};
	double s0=norm360(sum_sid);
	double target=(std::floor(s0/NAK_SPAN)+1.0)*NAK_SPAN;
	double shift=norm180(s0-sum_at(t.jd_utc));
	auto f=[&](double jd){ return norm180(sum_at(jd)+shift-target); };
	return cross_fwd(f,t.jd_utc,0.25,3.0);
}

PanchangResult PanDeriv::derive(double sun_sid,double moon_sid,
								const Instant&t,const Location&loc,AyaSys sys){
	loc.validate();
	chk_lon(sun_sid,"Sun",t);
	chk_lon(moon_sid,"Moon",t);

	PanchangResult r;
	r.jd_utc=t.jd_utc;
	r.loc=loc;
	r.sys=sys;
	AyaVal av=aya.value(sys,t);
	r.aya_deg=av.deg;
	r.aya_extrap=av.extrap;
	r.sun_sid=norm360(sun_sid);
	r.moon_sid=norm360(moon_sid);

	PanElems e=elems(r.sun_sid,r.moon_sid,kar);
	r.tithi=e.tithi;
	r.nak=e.nak;
	r.yoga=e.yoga;
	r.karana=e.karana;
	r.phase=e.phase;
	r.sun_rashi=e.sun_rashi;
	r.moon_rashi=e.moon_rashi;
	r.ritu=pan_tab::ritu_name(((r.sun_rashi+1)%12)/2);

	r.tithi.end_jd=tithi_end(t,r.moon_sid-r.sun_sid);
	r.nak.end_jd=nak_end(t,r.moon_sid,sys);
	r.yoga.end_jd=yoga_end(t,r.sun_sid+r.moon_sid,sys);

	int off=loc.utc_off();
	CivilDT civ=CivilDT::from_utc(t.jd_utc,off);
	DaySpan ds=day_span(loc,civ.day_start());
	r.sunrise=ds.sunrise;
	r.sunset=ds.sunset;
	r.noon=ds.noon;
	r.moonrise=ds.moonrise;
	r.moonset=ds.moonset;
	r.has_moonrise=ds.has_moonrise;
	r.has_moonset=ds.has_moonset;
	r.dawn=ds.dawn;
	r.dusk=ds.dusk;
	r.has_dawn=ds.has_dawn;
	r.has_dusk=ds.has_dusk;
	if(!ds.has_moonrise){
		r.warnings.push_back("no moonrise on this day");
	}
	if(!ds.has_moonset){
		r.warnings.push_back("no moonset on this day");
	}
	if(!ds.has_dawn||!ds.has_dusk){
		r.warnings.push_back("Sun does not reach civil twilight depth");
	}
	r.day_len_h=(ds.sunset-ds.sunrise)*24.0;

	int wday=civ.wday();
	r.vara.idx=t.jd_utc<ds.sunrise?(wday+6)%7:wday;
	r.vara.name=pan_tab::vara_name(r.vara.idx);

	r.rahu=kaal(ds.sunrise,ds.sunset,pan_tab::rahu_seg(wday));
	r.gulika=kaal(ds.sunrise,ds.sunset,pan_tab::gulika_seg(wday));
	r.yama=kaal(ds.sunrise,ds.sunset,pan_tab::yama_seg(wday));
	r.brahma.st=ds.sunrise-96.0/MIN_DAY;
	r.brahma.ed=ds.sunrise-48.0/MIN_DAY;
	double half=(ds.sunset-ds.sunrise)/30.0;
	r.abhijit.st=ds.noon-half;
	r.abhijit.ed=ds.noon+half;

	for(Body b : all_bodies()){
		GrahaPos g;
		g.name=body_name(b);
		if(b==Body::SUN){
			g.sid=r.sun_sid;
		}else if(b==Body::MOON){
			g.sid=r.moon_sid;
		}else{
			g.sid=aya.to_sidereal(eph.get_longitude(b,t),sys,t);
		}
		g.trop=norm360(g.sid+av.deg);
		r.grahas.push_back(g);
	}
	GrahaPos rahu;
	rahu.name="Rahu";
	rahu.trop=rahu_node(t.jc());
	rahu.sid=aya.to_sidereal(rahu.trop,sys,t);
	GrahaPos ketu;
	ketu.name="Ketu";
	ketu.trop=norm360(rahu.trop+180.0);
	ketu.sid=norm360(rahu.sid+180.0);
	r.grahas.push_back(rahu);
	r.grahas.push_back(ketu);
	for(auto&g : r.grahas){
		g.rashi=clamp_idx(g.sid/30.0,12);
		g.rashi_name=pan_tab::rashi_name(g.rashi);
		g.nak=clamp_idx(g.sid/NAK_SPAN,27);
		g.nak_name=pan_tab::nak_name(g.nak);
	}

	r.years=years_of(civ.year,civ.month);
	r.panchaka=r.nak.idx>=22;
	if(r.panchaka){
		int py_wday=(wday+6)%7;
		std::size_t k=static_cast<std::size_t>((r.nak.idx-22+py_wday)%5);
		r.panchaka_kind=PANCHAKA[k];
	}
	r.lst_h=Topo::lst_hours(t,loc.lon);
	r.lmt_h=lmt_hours(t.jd_utc,loc.lon);
	r.shool=shool_of(r.vara.idx,r.moon_sid);
	r.tara=tara_of(birth_nak,r.nak.idx,r.tithi.idx);
	return r;
}
