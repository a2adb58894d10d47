#pragma once

#include<map>
#include<set>
#include<string>
#include<utility>

#include "panchang/math.hpp"

void cfg_spice();
void chk_spice(const std::string&context);

struct EphRead{
	std::string filepath;
	int SSB;
	int SUN;
	int EARTH;
	int MOON;
	int MERCURY;
	int VENUS;
	int MARS;
	int JUPITER;
	int SATURN;
	std::map<int,std::string> id_name;
	double cov_lo;
	double cov_hi;
	static std::set<std::string> load_paths;

	explicit EphRead(const std::string&path);

	void load_kern();

	std::string to_name(int code) const;

	// TDB coverage common to all SPK segments of the file
	void read_cov();

	bool covers(double jd_tdb) const;

	static double et_fromjd(double jd_tdb);

	std::pair<Vec3,Vec3> get_state(int target,int observer,double jd_tdb);

	Vec3 get_pos(int target,int observer,double jd_tdb);

	Vec3 get_vel(int target,int observer,double jd_tdb);
};
