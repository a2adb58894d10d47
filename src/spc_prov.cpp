#include "panchang/spc_prov.hpp"

#include<stdexcept>

#include "panchang/errors.hpp"

SpcProv::SpcProv(const std::string&path){
	try{
		eph_=std::make_unique<EphRead>(path);
	}catch(const std::runtime_error&ex){
		throw CalcError(ErrKind::EPHEM_UNAVAIL,ex.what());
	}
	app_=std::make_unique<AppLon>(*eph_);
}

std::string SpcProv::name() const{ return "spk:"+eph_->filepath; }

int SpcProv::body_id(Body b) const{
	switch(b){
	case Body::SUN:
		return eph_->SUN;
	case Body::MOON:
		return eph_->MOON;
	case Body::MERCURY:
		return eph_->MERCURY;
	case Body::VENUS:
		return eph_->VENUS;
	case Body::MARS:
		return eph_->MARS;
	case Body::JUPITER:
		return eph_->JUPITER;
	case Body::SATURN:
		return eph_->SATURN;
	}
	return eph_->SUN;
}

EclPos SpcProv::get_pos(Body b,const Instant&t){
	ErrCtx ctx;
	ctx.jd_utc=t.jd_utc;
	ctx.body=body_name(b);
	// one day margin for light time
	if(!eph_->covers(t.jd_tt-1.0)||!eph_->covers(t.jd_tt+1.0)){
		throw CalcError(ErrKind::EPHEM_UNAVAIL,"instant outside kernel coverage",
						ctx);
	}
	std::lock_guard<std::mutex> lock(mtx_);
	try{
		return app_->app_pos(body_id(b),t.jd_tt);
	}catch(const std::runtime_error&ex){
		throw CalcError(ErrKind::EPHEM_UNAVAIL,ex.what(),ctx);
	}
}
