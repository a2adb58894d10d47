#include "panchang/errors.hpp"

#include<cmath>
#include<iomanip>
#include<sstream>

std::string err_name(ErrKind kind){
	switch(kind){
	case ErrKind::INVALID_COORD:
		return "InvalidCoordinate";
	case ErrKind::INVALID_INSTANT:
		return "InvalidInstant";
	case ErrKind::UNKNOWN_AYANAMSHA:
		return "UnknownAyanamshaSystem";
	case ErrKind::EPHEM_UNAVAIL:
		return "EphemerisUnavailable";
	case ErrKind::NO_RISE_SET:
		return "NoRiseOrSet";
	case ErrKind::EMPTY_WINDOW:
		return "EmptySearchWindow";
	}
	return "Unknown";
}

std::string ErrCtx::str() const{
	std::ostringstream oss;
	oss<<std::setprecision(10);
	bool first=true;
	auto sep=[&](){
		if(!first){
			oss<<" ";
		}
		first=false;
	};
	if(std::isfinite(jd_utc)){
		sep();
		oss<<"jd_utc="<<jd_utc;
	}
	if(std::isfinite(lat)||std::isfinite(lon)){
		sep();
		oss<<"lat="<<lat<<" lon="<<lon;
	}
	if(!system.empty()){
		sep();
		oss<<"system="<<system;
	}
	if(!body.empty()){
		sep();
		oss<<"body="<<body;
	}
	return oss.str();
}

namespace{

std::string mk_what(ErrKind kind,const std::string&msg,const ErrCtx&ctx){
	std::string s=err_name(kind)+": "+msg;
	std::string c=ctx.str();
	if(!c.empty()){
		s+=" ["+c+"]";
	}
	return s;
}

}

CalcError::CalcError(ErrKind kind,const std::string&msg,const ErrCtx&ctx)
	: std::runtime_error(mk_what(kind,msg,ctx)),kind_(kind),ctx_(ctx),
	  detail_(msg){}
