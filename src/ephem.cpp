#include "panchang/ephem.hpp"

#include<cmath>

#include "panchang/errors.hpp"
#include "panchang/frames.hpp"

const std::vector<Body>&all_bodies(){
	static const std::vector<Body> v={Body::SUN,Body::MOON,Body::MERCURY,
									  Body::VENUS,Body::MARS,Body::JUPITER,
									  Body::SATURN};
	return v;
}

std::string body_name(Body b){
	switch(b){
	case Body::SUN:
		return "Sun";
	case Body::MOON:
		return "Moon";
	case Body::MERCURY:
		return "Mercury";
	case Body::VENUS:
		return "Venus";
	case Body::MARS:
		return "Mars";
	case Body::JUPITER:
		return "Jupiter";
	case Body::SATURN:
		return "Saturn";
	}
	return "?";
}

Location Location::make(double lat,double lon,double elev){
	Location loc;
	loc.lat=lat;
	loc.lon=lon;
	loc.elev=elev;
	loc.validate();
	return loc;
}

Location Location::make(double lat,double lon,double elev,int off_min){
	Location loc=make(lat,lon,elev);
	if(off_min<-14*60||off_min>14*60){
		ErrCtx ctx;
		ctx.lat=lat;
		ctx.lon=lon;
		throw CalcError(ErrKind::INVALID_COORD,"utc offset out of range",ctx);
	}
	loc.off_min=off_min;
	loc.has_off=true;
	return loc;
}

void Location::validate() const{
	ErrCtx ctx;
	ctx.lat=lat;
	ctx.lon=lon;
	if(!std::isfinite(lat)||lat<-90.0||lat>90.0){
		throw CalcError(ErrKind::INVALID_COORD,"latitude outside [-90,90]",ctx);
	}
	if(!std::isfinite(lon)||lon<-180.0||lon>180.0){
		throw CalcError(ErrKind::INVALID_COORD,"longitude outside [-180,180]",
						ctx);
	}
	if(!std::isfinite(elev)||elev<-500.0||elev>10000.0){
		throw CalcError(ErrKind::INVALID_COORD,"elevation outside [-500,10000] m",
						ctx);
	}
}

int Location::utc_off() const{
	if(has_off){
		return off_min;
	}
	return static_cast<int>(std::lround(lon*4.0));
}

double EphemProv::get_longitude(Body b,const Instant&t){
	EclPos p=get_pos(b,t);
	if(!std::isfinite(p.lon)){
		ErrCtx ctx;
		ctx.jd_utc=t.jd_utc;
		ctx.body=body_name(b);
		throw CalcError(ErrKind::EPHEM_UNAVAIL,name()+" returned no longitude",
						ctx);
	}
	return norm360(p.lon);
}

double EphemProv::get_altitude(Body b,const Instant&t,const Location&loc){
	EclPos p=get_pos(b,t);
	if(!std::isfinite(p.lon)||!std::isfinite(p.lat)||!std::isfinite(p.dist_km)||
	   p.dist_km<=0.0){
		ErrCtx ctx;
		ctx.jd_utc=t.jd_utc;
		ctx.lat=loc.lat;
		ctx.lon=loc.lon;
		ctx.body=body_name(b);
		throw CalcError(ErrKind::EPHEM_UNAVAIL,name()+" returned a bad position",
						ctx);
	}
	return Topo::altitude(p.lon,p.lat,p.dist_km,t,loc.lat,loc.lon);
}

double EphemProv::hor_parallax(Body b,const Instant&t){
	EclPos p=get_pos(b,t);
	return std::asin(EARTH_RKM/p.dist_km)*RAD2DEG;
}
