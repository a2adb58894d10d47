#include "panchang/ana_ephem.hpp"

#include<cmath>
#include<cstdlib>

#include "panchang/errors.hpp"
#include "panchang/frames.hpp"

namespace{

struct LonDist{
	int d,m,mp,f;
	double l;
	double r;
};

struct LatTerm{
	int d,m,mp,f;
	double b;
};

// longitude in 1e-6 deg, distance in metres
const LonDist LON_DIST[]={
	{0,0,1,0,6288774,-20905355},
	{2,0,-1,0,1274027,-3699111},
	{2,0,0,0,658314,-2955968},
	{0,0,2,0,213618,-569925},
	{0,1,0,0,-185116,48888},
	{0,0,0,2,-114332,-3149},
	{2,0,-2,0,58793,246158},
	{2,-1,-1,0,57066,-152138},
	{2,0,1,0,53322,-170733},
	{2,-1,0,0,45758,-204586},
	{0,1,-1,0,-40923,-129620},
	{1,0,0,0,-34720,108743},
	{0,1,1,0,-30383,104755},
	{2,0,0,-2,15327,10321},
	{0,0,1,2,-12528,0},
	{0,0,1,-2,10980,79661},
	{4,0,-1,0,10675,-34782},
	{0,0,3,0,10034,-23210},
	{4,0,-2,0,8548,-21636},
	{2,1,-1,0,-7888,24208},
	{2,1,0,0,-6766,30824},
	{1,0,-1,0,-5163,-8379},
	{1,1,0,0,4987,-16675},
	{2,-1,1,0,4036,-12831},
	{2,0,2,0,3994,-10445},
	{4,0,0,0,3861,-11650},
	{2,0,-3,0,3665,14403},
	{0,1,-2,0,-2689,-7003},
	{2,0,-1,2,-2602,0},
	{2,-1,-2,0,2390,10056},
	{1,0,1,0,-2348,6322},
	{2,-2,0,0,2236,-9884},
	{0,1,2,0,-2120,5751},
	{0,2,0,0,-2069,0},
	{2,-2,-1,0,2048,-4950},
	{2,0,1,-2,-1773,4130},
	{2,0,0,2,-1595,0},
	{4,-1,-1,0,1215,-3958},
	{0,0,2,2,-1110,0},
	{3,0,-1,0,-892,3258},
	{2,1,1,0,-810,2616},
	{4,-1,-2,0,759,-1897},
	{0,2,-1,0,-713,-2117},
	{2,2,-1,0,-700,2354},
	{2,1,-2,0,691,0},
	{2,-1,0,-2,596,0},
	{4,0,1,0,549,-1423},
	{0,0,4,0,537,-1117},
	{4,-1,0,0,520,-1571},
	{1,0,-2,0,-487,-1739},
	{2,1,0,-2,-399,0},
	{0,0,2,-2,-381,-4421},
	{1,1,1,0,351,0},
	{3,0,-2,0,-340,0},
	{4,0,-3,0,330,0},
	{2,-1,2,0,327,0},
	{0,2,1,0,-323,1165},
	{1,1,-1,0,299,0},
	{2,0,3,0,294,0},
	{2,0,-1,-2,0,8752},
};

// 1e-6 deg
const LatTerm LAT[]={
	{0,0,0,1,5128122},
	{0,0,1,1,280602},
	{0,0,1,-1,277693},
	{2,0,0,-1,173237},
	{2,0,-1,1,55413},
	{2,0,-1,-1,46271},
	{2,0,0,1,32573},
	{0,0,2,1,17198},
	{2,0,1,-1,9266},
	{0,0,2,-1,8822},
	{2,-1,0,-1,8216},
	{2,0,-2,-1,4324},
	{2,0,1,1,4200},
	{2,1,0,-1,-3359},
	{2,-1,-1,1,2463},
	{2,-1,0,1,2211},
	{2,-1,-1,-1,2065},
	{0,1,-1,-1,-1870},
	{4,0,-1,-1,1828},
	{0,1,0,1,-1794},
	{0,0,0,3,-1749},
	{0,1,-1,1,-1565},
	{1,0,0,1,-1491},
	{0,1,1,1,-1475},
	{0,1,1,-1,-1410},
	{0,1,0,-1,-1344},
	{1,0,0,-1,-1335},
	{0,0,3,1,1107},
	{4,0,0,-1,1021},
	{4,0,-1,1,833},
	{0,0,1,-3,777},
	{4,0,-2,1,671},
	{2,0,0,-3,607},
	{2,0,2,-1,596},
	{2,-1,1,-1,491},
	{2,0,-2,1,-451},
	{0,0,3,-1,439},
	{2,0,2,1,422},
	{2,0,-3,-1,421},
	{2,1,-1,1,-366},
	{2,1,0,1,-351},
	{4,0,0,1,331},
	{2,-1,1,1,315},
	{2,-2,0,-1,302},
	{0,0,1,3,-283},
	{2,1,1,-1,-229},
	{1,1,0,-1,223},
	{1,1,0,1,223},
	{0,1,-2,-1,-220},
	{2,1,-1,-1,-220},
	{1,0,1,1,-185},
	{2,-1,-2,-1,181},
	{0,1,2,1,-177},
	{4,0,-2,-1,176},
	{4,-1,-1,-1,166},
	{1,0,1,-1,-164},
	{4,0,1,-1,132},
	{1,0,-1,-1,-119},
	{4,-1,0,-1,115},
	{2,-2,0,1,107},
};

// a, e, i, L, long. perihelion, node with rates per century; J2000 ecliptic
struct Elem{
	double a,da;
	double e,de;
	double i,di;
	double L,dL;
	double w,dw;
	double O,dO;
};

const Elem EL_MERCURY={0.38709927,0.00000037,0.20563593,0.00001906,
					   7.00497902,-0.00594749,252.25032350,149472.67411175,
					   77.45779628,0.16047689,48.33076593,-0.12534081};
const Elem EL_VENUS={0.72333566,0.00000390,0.00677672,-0.00004107,
					 3.39467605,-0.00078890,181.97909950,58517.81538729,
					 131.60246718,0.00268329,76.67984255,-0.27769418};
const Elem EL_EMB={1.00000261,0.00000562,0.01671123,-0.00004392,
				   -0.00001531,-0.01294668,100.46457166,35999.37244981,
				   102.93768193,0.32327364,0.0,0.0};
const Elem EL_MARS={1.52371034,0.00001847,0.09339410,0.00007882,
					1.84969142,-0.00813131,-4.55343205,19140.30268499,
					-23.94362959,0.44441088,49.55953891,-0.29257343};
const Elem EL_JUPITER={5.20288700,-0.00011607,0.04838624,-0.00013253,
					   1.30439695,-0.00183714,34.39644051,3034.74612775,
					   14.72847983,0.21252668,100.47390909,0.20469106};
const Elem EL_SATURN={9.53667594,-0.00125060,0.05386179,-0.00050991,
					  2.48599187,0.00193609,49.95424423,1222.49362201,
					  92.59887831,-0.41897216,113.66242448,-0.28867794};

double poly(double T,double c0,double c1,double c2,double c3,double c4){
	return c0+T*(c1+T*(c2+T*(c3+T*c4)));
}

// heliocentric J2000 ecliptic position, AU
Vec3 kepler(const Elem&el,double T){
	double a=el.a+el.da*T;
	double e=el.e+el.de*T;
	double inc=(el.i+el.di*T)*DEG2RAD;
	double L=el.L+el.dL*T;
	double wb=el.w+el.dw*T;
	double Om=el.O+el.dO*T;
	double w=(wb-Om)*DEG2RAD;
	double M=norm180(L-wb)*DEG2RAD;

	double E=M+e*std::sin(M);
	for(int i=0;i<30;++i){
		double dE=(M-(E-e*std::sin(E)))/(1.0-e*std::cos(E));
		E+=dE;
		if(std::fabs(dE)<1e-12){
			break;
		}
	}
	double xp=a*(std::cos(E)-e);
	double yp=a*std::sqrt(1.0-e*e)*std::sin(E);

	double cw=std::cos(w),sw=std::sin(w);
	double cO=std::cos(Om*DEG2RAD),sO=std::sin(Om*DEG2RAD);
	double ci=std::cos(inc),si=std::sin(inc);
	return Vec3((cw*cO-sw*sO*ci)*xp+(-sw*cO-cw*sO*ci)*yp,
				(cw*sO+sw*cO*ci)*xp+(-sw*sO+cw*cO*ci)*yp,
				(sw*si)*xp+(cw*si)*yp);
}

// general precession in longitude, IAU 2006, degrees
double prec_lon(double T){
	return poly(T,0.0,5028.796195,1.1054348,0.00007964,-0.000023857)/3600.0;
}

double dpsi_deg(double T){
	return PrecNut::nut_ang(J2000+T*DAYS_JC).first*RAD2DEG;
}

}

AnaProv::AnaProv() : max_abs_jc(50.0){}

std::string AnaProv::name() const{ return "analytic"; }

EclPos AnaProv::sun_pos(double T){
	double L0=poly(T,280.46646,36000.76983,0.0003032,0.0,0.0);
	double M=poly(T,357.52911,35999.05029,-0.0001537,0.0,0.0)*DEG2RAD;
	double e=poly(T,0.016708634,-0.000042037,-0.0000001267,0.0,0.0);
	double C=(1.914602-0.004817*T-0.000014*T*T)*std::sin(M)+
			 (0.019993-0.000101*T)*std::sin(2.0*M)+0.000289*std::sin(3.0*M);
	double v=M+C*DEG2RAD;
	double R=1.000001018*(1.0-e*e)/(1.0+e*std::cos(v));
	double lam=L0+C+dpsi_deg(T)-20.4898/3600.0/R;
	return {norm360(lam),0.0,R*AU_KM};
}

EclPos AnaProv::moon_pos(double T){
	double Lp=poly(T,218.3164477,481267.88123421,-0.0015786,1.0/538841.0,
				   -1.0/65194000.0);
	double D=poly(T,297.8501921,445267.1114034,-0.0018819,1.0/545868.0,
				  -1.0/113065000.0)*DEG2RAD;
	double M=poly(T,357.5291092,35999.0502909,-0.0001536,1.0/24490000.0,0.0)*
			 DEG2RAD;
	double Mp=poly(T,134.9633964,477198.8675055,0.0087414,1.0/69699.0,
				   -1.0/14712000.0)*DEG2RAD;
	double F=poly(T,93.2720950,483202.0175233,-0.0036539,-1.0/3526000.0,
				  1.0/863310000.0)*DEG2RAD;
	double E=1.0-0.002516*T-0.0000074*T*T;

	double sl=0.0;
	double sr=0.0;
	for(const auto&t : LON_DIST){
		double k=1.0;
		if(t.m!=0){
			k=std::abs(t.m)==2?E*E:E;
		}
		double arg=t.d*D+t.m*M+t.mp*Mp+t.f*F;
		sl+=k*t.l*std::sin(arg);
		sr+=k*t.r*std::cos(arg);
	}
	double sb=0.0;
	for(const auto&t : LAT){
		double k=1.0;
		if(t.m!=0){
			k=std::abs(t.m)==2?E*E:E;
		}
		sb+=k*t.b*std::sin(t.d*D+t.m*M+t.mp*Mp+t.f*F);
	}

	double Lr=Lp*DEG2RAD;
	double A1=(119.75+131.849*T)*DEG2RAD;
	double A2=(53.09+479264.290*T)*DEG2RAD;
	double A3=(313.45+481266.484*T)*DEG2RAD;
	sl+=3958.0*std::sin(A1)+1962.0*std::sin(Lr-F)+318.0*std::sin(A2);
	sb+=-2235.0*std::sin(Lr)+382.0*std::sin(A3)+175.0*std::sin(A1-F)+
		175.0*std::sin(A1+F)+127.0*std::sin(Lr-Mp)-115.0*std::sin(Lr+Mp);

	double lam=Lp+sl/1e6+dpsi_deg(T);
	return {norm360(lam),sb/1e6,385000.56+sr/1000.0};
}

EclPos AnaProv::planet_pos(Body b,double T){
	const Elem*el=nullptr;
	switch(b){
	case Body::MERCURY:
		el=&EL_MERCURY;
		break;
	case Body::VENUS:
		el=&EL_VENUS;
		break;
	case Body::MARS:
		el=&EL_MARS;
		break;
	case Body::JUPITER:
		el=&EL_JUPITER;
		break;
	case Body::SATURN:
		el=&EL_SATURN;
		break;
	default:
		throw CalcError(ErrKind::EPHEM_UNAVAIL,
						"no planetary elements for "+body_name(b));
	}
	Vec3 g=kepler(*el,T)-kepler(EL_EMB,T);
	double r=g.norm();
	double lam=std::atan2(g.y,g.x)*RAD2DEG+prec_lon(T)+dpsi_deg(T);
	double beta=std::asin(g.z/r)*RAD2DEG;
	return {norm360(lam),beta,r*AU_KM};
}

EclPos AnaProv::get_pos(Body b,const Instant&t){
	double T=t.jc();
	if(!std::isfinite(T)||std::fabs(T)>max_abs_jc){
		ErrCtx ctx;
		ctx.jd_utc=t.jd_utc;
		ctx.body=body_name(b);
		throw CalcError(ErrKind::EPHEM_UNAVAIL,
						"instant outside analytic series range",ctx);
	}
	switch(b){
	case Body::SUN:
		return sun_pos(T);
	case Body::MOON:
		return moon_pos(T);
	default:
		return planet_pos(b,T);
	}
}
