#pragma once

#include<utility>

#include "panchang/math.hpp"

struct Instant;

struct CoordTf{
	static Mat3 R1(double angle);

	static Mat3 R3(double angle);

	// ecliptic (lon,lat) -> equatorial (ra,dec), radians
	static std::pair<double,double> ecl2eq(double lam,double beta,double eps);
};

struct PrecNut{
	// GCRS -> true equator and equinox of date
	static Mat3 npb_mat(double jd_tt);

	static double mean_obl(double jd_tt);

	static std::pair<double,double> nut_ang(double jd_tt);

	static double true_obl(double jd_tt);

	// radians
	static double gast(double jd_ut,double jd_tt);
};

struct Topo{
	// Topocentric altitude in degrees of a body at apparent ecliptic
	// (lam,beta) degrees and geocentric distance dist_km. Unrefracted.
	static double altitude(double lam,double beta,double dist_km,
						   const Instant&t,double lat,double lon);

	static double lst_hours(const Instant&t,double lon);
};
