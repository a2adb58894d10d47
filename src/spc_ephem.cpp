#include "panchang/spc_ephem.hpp"

#include<algorithm>
#include<cmath>
#include<filesystem>
#include<limits>
#include<mutex>
#include<stdexcept>

extern "C"{
#include "SpiceUsr.h"
}

namespace fs=std::filesystem;

std::set<std::string> EphRead::load_paths;

EphRead::EphRead(const std::string&path){
	filepath=path;
	if(filepath.empty()){
		throw std::runtime_error("ephemeris path is empty");
	}
	SSB=0;
	SUN=10;
	EARTH=399;
	MOON=301;
	MERCURY=1;
	VENUS=2;
	MARS=4;
	JUPITER=5;
	SATURN=6;

	id_name[SSB]="SOLAR SYSTEM BARYCENTER";
	id_name[SUN]="SUN";
	id_name[EARTH]="EARTH";
	id_name[MOON]="MOON";
	id_name[MERCURY]="MERCURY BARYCENTER";
	id_name[VENUS]="VENUS BARYCENTER";
	id_name[MARS]="MARS BARYCENTER";
	id_name[JUPITER]="JUPITER BARYCENTER";
	id_name[SATURN]="SATURN BARYCENTER";

	cov_lo=std::numeric_limits<double>::quiet_NaN();
	cov_hi=std::numeric_limits<double>::quiet_NaN();

	cfg_spice();
	load_kern();
	read_cov();
}

void EphRead::load_kern(){
	cfg_spice();
	if(load_paths.find(filepath)!=load_paths.end()){
		return;
	}

	if(!fs::exists(filepath)){
		throw std::runtime_error("ephemeris file not found: "+filepath);
	}
	std::error_code ec;
	auto fsize=fs::file_size(filepath,ec);
	if(ec||fsize==0){
		throw std::runtime_error("ephemeris file is not readable or empty: "+
								 filepath);
	}

	furnsh_c(filepath.c_str());
	chk_spice("Failed to load ephemeris kernel");

	SpiceInt count=0;
	ktotal_c("SPK",&count);
	chk_spice("Failed to query loaded SPK kernels");
	if(count==0){
		throw std::runtime_error(
			"No SPK kernels are loaded; expected ephemeris "+filepath);
	}
	load_paths.insert(filepath);
}

std::string EphRead::to_name(int code) const{
	auto it=id_name.find(code);
	if(it==id_name.end()){
		throw std::runtime_error("Unknown target/observer code");
	}
	return it->second;
}

void EphRead::read_cov(){
	double lo=-std::numeric_limits<double>::infinity();
	double hi=std::numeric_limits<double>::infinity();
	bool any=false;

	for(const auto&kv : id_name){
		if(kv.first==SSB){
			continue;
		}
		SPICEDOUBLE_CELL(cover,400000);
		scard_c(0,&cover);
		spkcov_c(filepath.c_str(),kv.first,&cover);
		chk_spice("spkcov_c failed for "+kv.second);
		SpiceInt nint=wncard_c(&cover);
		if(nint<=0){
			continue;
		}
		SpiceDouble b=0.0;
		SpiceDouble e=0.0;
		SpiceDouble skip=0.0;
		wnfetd_c(&cover,0,&b,&skip);
		wnfetd_c(&cover,nint-1,&skip,&e);
		lo=std::max(lo,static_cast<double>(b));
		hi=std::min(hi,static_cast<double>(e));
		any=true;
	}
	if(!any||!(lo<hi)){
		throw std::runtime_error("ephemeris has no usable coverage: "+filepath);
	}
	cov_lo=J2000+lo/SEC_DAY;
	cov_hi=J2000+hi/SEC_DAY;
}

bool EphRead::covers(double jd_tdb) const{
	return jd_tdb>=cov_lo&&jd_tdb<=cov_hi;
}

double EphRead::et_fromjd(double jd_tdb){ return (jd_tdb-J2000)*SEC_DAY; }

std::pair<Vec3,Vec3> EphRead::get_state(int target,int observer,double jd_tdb){
	double et=et_fromjd(jd_tdb);
	std::string tname=to_name(target);
	std::string oname=to_name(observer);
	SpiceDouble state[6];
	SpiceDouble lt;
	spkezr_c(tname.c_str(),et,"J2000","NONE",oname.c_str(),state,&lt);
	chk_spice("spkezr_c failed for target "+tname+" observer "+oname);
	Vec3 pos(state[0]/AU_KM,state[1]/AU_KM,state[2]/AU_KM);
	Vec3 vel(state[3]*(SEC_DAY/AU_KM),state[4]*(SEC_DAY/AU_KM),
			 state[5]*(SEC_DAY/AU_KM));
	return {pos,vel};
}

Vec3 EphRead::get_pos(int target,int observer,double jd_tdb){
	return get_state(target,observer,jd_tdb).first;
}

Vec3 EphRead::get_vel(int target,int observer,double jd_tdb){
	return get_state(target,observer,jd_tdb).second;
}

void chk_spice(const std::string&context){
	if(!failed_c()){
		return;
	}

	SpiceChar msg[1841];
	getmsg_c("LONG",sizeof(msg),msg);
	reset_c();
	throw std::runtime_error(context+": "+std::string(msg));
}

void cfg_spice(){
	static std::once_flag flag;
	std::call_once(flag,[](){
		SpiceChar action[]="RETURN";
		SpiceChar detail[]="SHORT,EXPLAIN";
		erract_c("SET",0,action);
		errprt_c("SET",0,detail);
	});
}
