#pragma once

#include<limits>
#include<stdexcept>
#include<string>
#include<utility>

enum class ErrKind{
	INVALID_COORD,
	INVALID_INSTANT,
	UNKNOWN_AYANAMSHA,
	EPHEM_UNAVAIL,
	NO_RISE_SET,
	EMPTY_WINDOW,
};

std::string err_name(ErrKind kind);

// Inputs needed to reproduce a failure. NaN/empty when not applicable.
struct ErrCtx{
	double jd_utc=std::numeric_limits<double>::quiet_NaN();
	double lat=std::numeric_limits<double>::quiet_NaN();
	double lon=std::numeric_limits<double>::quiet_NaN();
	std::string system;
	std::string body;

	std::string str() const;
};

class CalcError : public std::runtime_error{
public:
	CalcError(ErrKind kind,const std::string&msg,const ErrCtx&ctx=ErrCtx());

	ErrKind kind() const{ return kind_; }
	const ErrCtx&ctx() const{ return ctx_; }
	const std::string&detail() const{ return detail_; }

private:
	ErrKind kind_;
	ErrCtx ctx_;
	std::string detail_;
};

template<typename T>
struct Res{
	bool ok=false;
	T value{};
	ErrKind kind=ErrKind::INVALID_INSTANT;
	std::string message;
	ErrCtx ctx;

	explicit operator bool() const{ return ok; }

	static Res good(T v){
		Res r;
		r.ok=true;
		r.value=std::move(v);
		return r;
	}

	static Res fail(const CalcError&ex){
		Res r;
		r.ok=false;
		r.kind=ex.kind();
		r.message=ex.detail();
		r.ctx=ex.ctx();
		return r;
	}
};

// Runs fn and folds a CalcError into Res. Other exceptions propagate.
template<typename T,typename Fn>
Res<T> guard_res(Fn&&fn){
	try{
		return Res<T>::good(fn());
	}catch(const CalcError&ex){
		return Res<T>::fail(ex);
	}
}
