#include "panchang/frames.hpp"

#include<algorithm>
#include<cmath>

#include "panchang/time_scale.hpp"

extern "C"{
#include "erfa.h"
}

Mat3 CoordTf::R1(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R;
	R.m[0][0]=1.0;
	R.m[1][1]=c;
	R.m[1][2]=s;
	R.m[2][1]=-s;
	R.m[2][2]=c;
	return R;
}

Mat3 CoordTf::R3(double angle){
	double c=std::cos(angle);
	double s=std::sin(angle);
	Mat3 R;
	R.m[0][0]=c;
	R.m[0][1]=s;
	R.m[1][0]=-s;
	R.m[1][1]=c;
	R.m[2][2]=1.0;
	return R;
}

std::pair<double,double> CoordTf::ecl2eq(double lam,double beta,double eps){
	Vec3 e=Vec3::from_sph(lam,beta,1.0);
	Vec3 q=R1(-eps)*e;
	double ra=std::atan2(q.y,q.x);
	if(ra<0.0){
		ra+=TWO_PI;
	}
	double dec=std::asin(std::max(-1.0,std::min(1.0,q.z)));
	return {ra,dec};
}

Mat3 PrecNut::npb_mat(double jd_tt){
	double d1=std::floor(jd_tt);
	double d2=jd_tt-d1;
	Mat3 R;
	eraPnm06a(d1,d2,R.m);
	return R;
}

double PrecNut::mean_obl(double jd_tt){
	double d1=std::floor(jd_tt);
	double d2=jd_tt-d1;
	return eraObl06(d1,d2);
}

std::pair<double,double> PrecNut::nut_ang(double jd_tt){
	double d1=std::floor(jd_tt);
	double d2=jd_tt-d1;
	double dpsi=0.0;
	double deps=0.0;
	eraNut06a(d1,d2,&dpsi,&deps);
	return {dpsi,deps};
}

double PrecNut::true_obl(double jd_tt){
	return mean_obl(jd_tt)+nut_ang(jd_tt).second;
}

double PrecNut::gast(double jd_ut,double jd_tt){
	double u1=std::floor(jd_ut);
	double u2=jd_ut-u1;
	double t1=std::floor(jd_tt);
	double t2=jd_tt-t1;
	return eraGst06a(u1,u2,t1,t2);
}

double Topo::altitude(double lam,double beta,double dist_km,const Instant&t,
					  double lat,double lon){
	double eps=PrecNut::true_obl(t.jd_tt);
	auto eq=CoordTf::ecl2eq(lam*DEG2RAD,beta*DEG2RAD,eps);
	double ha=PrecNut::gast(t.jd_utc,t.jd_tt)+lon*DEG2RAD-eq.first;
	double phi=lat*DEG2RAD;
	double sin_alt=std::sin(phi)*std::sin(eq.second)+
				   std::cos(phi)*std::cos(eq.second)*std::cos(ha);
	double alt=std::asin(std::max(-1.0,std::min(1.0,sin_alt)));
	double par=std::asin(EARTH_RKM/dist_km*std::cos(alt));
	return (alt-par)*RAD2DEG;
}

double Topo::lst_hours(const Instant&t,double lon){
	double lst=PrecNut::gast(t.jd_utc,t.jd_tt)+lon*DEG2RAD;
	return norm360(lst*RAD2DEG)/15.0;
}
