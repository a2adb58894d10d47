#pragma once

#include<string>
#include<vector>

#include "panchang/time_scale.hpp"

enum class Body{ SUN,MOON,MERCURY,VENUS,MARS,JUPITER,SATURN };

const std::vector<Body>&all_bodies();

std::string body_name(Body b);

struct Location{
	double lat=0.0;
	double lon=0.0;
	double elev=0.0;
	int off_min=0;
	bool has_off=false;

	static Location make(double lat,double lon,double elev=0.0);

	static Location make(double lat,double lon,double elev,int off_min);

	// throws InvalidCoordinate
	void validate() const;

	// explicit offset, else local mean time rounded to the minute
	int utc_off() const;
};

// Apparent geocentric ecliptic position of date.
struct EclPos{
	double lon;
	double lat;
	double dist_km;
};

class EphemProv{
public:
	virtual ~EphemProv()=default;

	virtual std::string name() const=0;

	// throws EphemerisUnavailable
	virtual EclPos get_pos(Body b,const Instant&t)=0;

	virtual double get_longitude(Body b,const Instant&t);

	virtual double get_altitude(Body b,const Instant&t,const Location&loc);

	// degrees
	virtual double hor_parallax(Body b,const Instant&t);
};
