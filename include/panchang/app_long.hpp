#pragma once

#include "panchang/ephem.hpp"
#include "panchang/frames.hpp"
#include "panchang/spc_ephem.hpp"

struct AberCorr{
	static double lightday(const Vec3&vec);

	// light-time and annual aberration corrected geocentric vector, AU
	static Vec3 geo_app(EphRead&eph,int target,double jd_tdb,int max_iter=3);
};

struct AppLon{
	EphRead&eph;

	bool rot_ok;
	double rot_jd;
	Mat3 rot_cache;

	explicit AppLon(EphRead&reader);

	// J2000 (ICRF) -> true ecliptic and equinox of date
	Mat3 rot_mat(double jd_tdb);

	EclPos app_pos(int target,double jd_tdb);
};
