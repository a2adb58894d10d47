#include "panchang/app_long.hpp"

#include<algorithm>
#include<cmath>

double AberCorr::lightday(const Vec3&vec){
	double r=vec.norm();
	return r/C_AUDAY;
}

Vec3 AberCorr::geo_app(EphRead&eph,int target,double jd_tdb,int max_iter){
	Vec3 xE_t=eph.get_pos(eph.EARTH,eph.SSB,jd_tdb);
	Vec3 vE_t=eph.get_vel(eph.EARTH,eph.SSB,jd_tdb);

	double tr=jd_tdb;
	Vec3 xt=eph.get_pos(target,eph.SSB,tr);
	for(int i=0;i<max_iter;++i){
		double tr_new=jd_tdb-lightday(xt-xE_t);
		if(std::fabs(tr_new-tr)<1e-12){
			break;
		}
		tr=tr_new;
		xt=eph.get_pos(target,eph.SSB,tr);
	}

	Vec3 r_geo=xt-xE_t;
	double r=r_geo.norm();
	Vec3 n=r_geo/r;

	Vec3 beta=vE_t/C_AUDAY;
	double beta2=Vec3::dot(beta,beta);
	double gamma_inv=std::sqrt(std::max(0.0,1.0-beta2));
	double nb=Vec3::dot(n,beta);

	Vec3 n_app=(gamma_inv*n+beta+(nb*beta)/(1.0+gamma_inv))/(1.0+nb);

	double n_app_norm=n_app.norm();
	if(n_app_norm==0.0){
		return n*r;
	}
	return (n_app/n_app_norm)*r;
}

AppLon::AppLon(EphRead&reader) : eph(reader),rot_ok(false),rot_jd(0.0){}

Mat3 AppLon::rot_mat(double jd_tdb){
	if(!rot_ok||rot_jd!=jd_tdb){
		rot_cache=CoordTf::R1(PrecNut::true_obl(jd_tdb))*PrecNut::npb_mat(jd_tdb);
		rot_jd=jd_tdb;
		rot_ok=true;
	}
	return rot_cache;
}

EclPos AppLon::app_pos(int target,double jd_tdb){
	Vec3 X=rot_mat(jd_tdb)*AberCorr::geo_app(eph,target,jd_tdb);
	double r=X.norm();
	double lam=std::atan2(X.y,X.x)*RAD2DEG;
	double beta=std::asin(std::max(-1.0,std::min(1.0,X.z/r)))*RAD2DEG;
	return {norm360(lam),beta,r*AU_KM};
}
