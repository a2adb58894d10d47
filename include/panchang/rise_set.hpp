#pragma once

#include<ostream>
#include<vector>

#include "panchang/ephem.hpp"

struct RsTask{
	Body body;
	bool rising;
	double jd_from;
	double span;
	double h0;
	bool back;
};

// Bracketing scan plus bisection on altitude(t)-h0, with widened retries.
struct RsSolver{
	EphemProv&eph;
	Location loc;
	double scan_step;
	double eps_days;
	int max_iter;
	int retries;

	RsSolver(EphemProv&e,const Location&l);

	static double sun_h0(double elev);

	static double moon_h0(double hp_deg,double elev);

	double alt_fn(const RsTask&task,double jd_utc);

	// first crossing in [a,b); false if none
	bool scan(const RsTask&task,double a,double b,double&lo,double&hi);

	double bisect(const RsTask&task,double lo,double hi);

	// false if no crossing after widening
	bool try_find(const RsTask&task,double&jd,std::ostream*log=nullptr);

	// throws NoRiseOrSet
	double find(const RsTask&task,std::ostream*log=nullptr);
};
