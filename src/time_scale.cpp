#include "panchang/time_scale.hpp"

#include<cmath>
#include<sstream>

#include "panchang/errors.hpp"

namespace{

int month_days(int y,int m){
	static const int DAYS[12]={31,28,31,30,31,30,31,31,30,31,30,31};
	if(m==2&&((y%4==0&&y%100!=0)||y%400==0)){
		return 29;
	}
	return DAYS[m-1];
}

double delta53(double year){
	double t=(year-1825.0)/100.0;
	double base=-150.568+31.4115*t*t+284.8436*std::cos(2.0*PI*(t+0.75)/14.0);
	double corr=0.1056*(std::pow(year/100.0-19.55,2)-0.49);
	return base+corr;
}

}

int TimeScale::leap_sec(double jd_utc){
	struct Entry{
		double jd;
		int leaps;
	};
	static const Entry table[]={
		{2441317.5,10},
		{2441499.5,11},
		{2441683.5,12},
		{2442048.5,13},
		{2442413.5,14},
		{2442778.5,15},
		{2443144.5,16},
		{2443509.5,17},
		{2443874.5,18},
		{2444239.5,19},
		{2444786.5,20},
		{2445151.5,21},
		{2445516.5,22},
		{2446247.5,23},
		{2447161.5,24},
		{2447892.5,25},
		{2448257.5,26},
		{2448804.5,27},
		{2449169.5,28},
		{2449534.5,29},
		{2450083.5,30},
		{2450630.5,31},
		{2451179.5,32},
		{2453736.5,33},
		{2454832.5,34},
		{2456109.5,35},
		{2457204.5,36},
		{2457754.5,37},
	};
	int leaps=0;
	for(const auto&e : table){
		if(jd_utc>=e.jd){
			leaps=e.leaps;
		}else{
			break;
		}
	}
	return leaps;
}

double TimeScale::deltayr(double year){
	double t=(year-1825.0)/100.0;
	return -150.568+31.4115*t*t+284.8436*std::cos(2.0*PI*(t+0.75)/14.0);
}

double TimeScale::jd_year(double jd){ return 2000.0+(jd-2451544.5)/365.2425; }

double TimeScale::delta_t(double jd_utc){
	double year=jd_year(jd_utc);
	if(year<1970.0||year>2026.0){
		return delta53(year);
	}
	if(year<1972.0){
		return deltayr(year);
	}
	return static_cast<double>(leap_sec(jd_utc))+32.184;
}

double TimeScale::utc_to_tt(double jd_utc){
	return jd_utc+delta_t(jd_utc)/SEC_DAY;
}

Instant::Instant() : jd_utc(J2000),jd_tt(TimeScale::utc_to_tt(J2000)){}

Instant Instant::from_utc(double jd_utc){
	ErrCtx ctx;
	ctx.jd_utc=jd_utc;
	if(!std::isfinite(jd_utc)){
		throw CalcError(ErrKind::INVALID_INSTANT,"instant is not finite",ctx);
	}
	double year=TimeScale::jd_year(jd_utc);
	if(year<YEAR_MIN||year>YEAR_MAX){
		throw CalcError(ErrKind::INVALID_INSTANT,
						"instant outside supported years -2999..3000",ctx);
	}
	double dt=TimeScale::delta_t(jd_utc);
	if(!std::isfinite(dt)){
		throw CalcError(ErrKind::INVALID_INSTANT,"delta T undefined",ctx);
	}
	Instant t;
	t.jd_utc=jd_utc;
	t.jd_tt=jd_utc+dt/SEC_DAY;
	return t;
}

Instant Instant::from_civil(int y,int m,int d,int h,int min,double sec,
							int off_min){
	if(m<1||m>12||d<1||d>month_days(y,m)||h<0||h>23||min<0||min>59||
	   !(sec>=0.0&&sec<61.0)){
		std::ostringstream msg;
		msg<<"civil date/time out of range: "<<y<<"-"<<m<<"-"<<d<<" "<<h<<":"
		   <<min<<":"<<sec<<" offset "<<off_min<<" min";
		throw CalcError(ErrKind::INVALID_INSTANT,msg.str());
	}
	return from_utc(greg2jd(y,m,d,h,min,sec)-off_min/MIN_DAY);
}

double Instant::jc() const{ return (jd_tt-J2000)/DAYS_JC; }
