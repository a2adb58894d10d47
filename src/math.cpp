#include "panchang/math.hpp"

#include<cmath>
#include<iomanip>
#include<sstream>

Vec3 Vec3::from_sph(double lon,double lat,double r){
	double cb=std::cos(lat);
	return Vec3(r*cb*std::cos(lon),r*cb*std::sin(lon),r*std::sin(lat));
}

double norm360(double deg){
	double v=std::fmod(deg,360.0);
	if(v<0.0){
		v+=360.0;
	}
	if(v>=360.0){
		v-=360.0;
	}
	return v;
}

double norm180(double deg){
	double v=norm360(deg);
	if(v>180.0){
		v-=360.0;
	}
	return v;
}

double greg2jd(int year,int month,int day,int hour,int minute,double second){
	int Y=year;
	int M=month;
	if(M<=2){
		Y-=1;
		M+=12;
	}
	// proleptic Gregorian throughout
	int A=static_cast<int>(std::floor(Y/100.0));
	int B=2-A+static_cast<int>(std::floor(A/4.0));

	double day_frac=(hour+(minute+second/60.0)/60.0)/24.0;

	double JD=std::floor(365.25*(Y+4716))+std::floor(30.6001*(M+1))+day+B-
			  1524.5+day_frac;
	return JD;
}

void jd2greg(double jd,int&year,int&month,int&day,int&hour,int&minute,
			 double&second){
	double Z_d=std::floor(jd+0.5);
	double F=(jd+0.5)-Z_d;
	long Z=static_cast<long>(Z_d);
	long alpha=static_cast<long>(std::floor((Z-1867216.25)/36524.25));
	long A=Z+1+alpha-static_cast<long>(std::floor(alpha/4.0));
	long B=A+1524;
	long C=static_cast<long>(std::floor((B-122.1)/365.25));
	long D=static_cast<long>(std::floor(365.25*C));
	long E=static_cast<long>((B-D)/30.6001);

	double day_d=B-D-std::floor(30.6001*E)+F;
	day=static_cast<int>(std::floor(day_d));
	double frac_day=day_d-day;

	if(E<14){
		month=static_cast<int>(E-1);
	}else{
		month=static_cast<int>(E-13);
	}

	if(month>2){
		year=static_cast<int>(C-4716);
	}else{
		year=static_cast<int>(C-4715);
	}

	double tot_secs=frac_day*SEC_DAY;
	if(tot_secs<0){
		tot_secs=0;
	}
	hour=static_cast<int>(tot_secs/3600.0);
	tot_secs-=hour*3600.0;
	minute=static_cast<int>(tot_secs/60.0);
	second=tot_secs-minute*60.0;

	if(second>=59.9995){
		second=0.0;
		minute+=1;
		if(minute>=60){
			minute=0;
			hour+=1;
			if(hour>=24){
				hour=0;
				jd2greg(jd+1.0,year,month,day,hour,minute,second);
			}
		}
	}
}

int jd_wday(double jd){
	long n=static_cast<long>(std::floor(jd+1.5));
	long w=n%7;
	if(w<0){
		w+=7;
	}
	return static_cast<int>(w);
}

CivilDT::CivilDT()
	: year(2000),month(1),day(1),hour(0),minute(0),second(0.0),off_min(0),
	  utc_jd(2451544.5){}

CivilDT CivilDT::from_utc(double jd_utc,int off_min){
	CivilDT t;
	t.utc_jd=jd_utc;
	t.off_min=off_min;
	double jd_local=jd_utc+off_min/MIN_DAY;
	jd2greg(jd_local,t.year,t.month,t.day,t.hour,t.minute,t.second);
	return t;
}

double CivilDT::day_start() const{
	return greg2jd(year,month,day)-off_min/MIN_DAY;
}

int CivilDT::wday() const{ return jd_wday(greg2jd(year,month,day)); }

std::string fmt_civil(const CivilDT&t){
	std::ostringstream oss;
	oss<<std::setfill('0')<<std::setw(4)<<t.year<<"-"<<std::setw(2)<<t.month
	   <<"-"<<std::setw(2)<<t.day<<" "<<std::setw(2)<<t.hour<<":"<<std::setw(2)
	   <<t.minute<<":"<<std::setw(2)<<static_cast<int>(t.second);
	int a=t.off_min<0?-t.off_min:t.off_min;
	oss<<(t.off_min<0?"-":"+")<<std::setw(2)<<a/60<<":"<<std::setw(2)<<a%60;
	return oss.str();
}
