#pragma once

#include "panchang/math.hpp"

constexpr double YEAR_MIN=-2999.0;
constexpr double YEAR_MAX=3000.0;

struct TimeScale{
	static int leap_sec(double jd_utc);

	static double deltayr(double year);

	// TT-UTC in seconds
	static double delta_t(double jd_utc);

	static double utc_to_tt(double jd_utc);

	static double jd_year(double jd);
};

// A point in time carried on both UTC and TT.
struct Instant{
	double jd_utc;
	double jd_tt;

	Instant();

	static Instant from_utc(double jd_utc);

	static Instant from_civil(int y,int m,int d,int h=0,int min=0,
							  double sec=0.0,int off_min=0);

	// Julian centuries TT since J2000
	double jc() const;
};
