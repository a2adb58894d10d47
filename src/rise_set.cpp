#include "panchang/rise_set.hpp"

#include<algorithm>
#include<cmath>
#include<iomanip>

#include "panchang/errors.hpp"

RsSolver::RsSolver(EphemProv&e,const Location&l)
	: eph(e),loc(l),scan_step(1.0/48.0),eps_days(1e-5),max_iter(60),
	  retries(2){}

double RsSolver::sun_h0(double elev){
	double dip=elev>0.0?0.0347*std::sqrt(elev):0.0;
	return -(0.833+dip);
}

double RsSolver::moon_h0(double hp_deg,double elev){
	double dip=elev>0.0?0.0347*std::sqrt(elev):0.0;
	// 0.7275*HP-0.5667 is for geocentric altitude; ours is topocentric
	return 0.7275*hp_deg-0.5667-hp_deg-dip;
}

double RsSolver::alt_fn(const RsTask&task,double jd_utc){
	return eph.get_altitude(task.body,Instant::from_utc(jd_utc),loc)-task.h0;
}

bool RsSolver::scan(const RsTask&task,double a,double b,double&lo,double&hi){
	double prev_jd=a;
	double prev_f=alt_fn(task,a);
	int steps=static_cast<int>(std::ceil((b-a)/scan_step));
	for(int i=1;i<=steps;++i){
		double jd=std::min(b,a+i*scan_step);
		double f=alt_fn(task,jd);
		bool hit=task.rising?(prev_f<0.0&&f>=0.0):(prev_f>0.0&&f<=0.0);
		if(hit){
			lo=prev_jd;
			hi=jd;
			return true;
		}
		prev_jd=jd;
		prev_f=f;
	}
	return false;
}

double RsSolver::bisect(const RsTask&task,double lo,double hi){
	double f_lo=alt_fn(task,lo);
	for(int iter=0;iter<max_iter;++iter){
		double mid=0.5*(lo+hi);
		if(hi-lo<eps_days){
			return mid;
		}
		double f_mid=alt_fn(task,mid);
		if((f_lo<0.0)==(f_mid<0.0)){
			lo=mid;
			f_lo=f_mid;
		}else{
			hi=mid;
		}
	}
	ErrCtx ctx;
	ctx.jd_utc=lo;
	ctx.lat=loc.lat;
	ctx.lon=loc.lon;
	ctx.body=body_name(task.body);
	throw CalcError(ErrKind::NO_RISE_SET,"root search did not converge",ctx);
}

bool RsSolver::try_find(const RsTask&task,double&jd,std::ostream*log){
	for(int k=0;k<=retries;++k){
		double a=task.back?task.jd_from-k/12.0:task.jd_from;
		double b=task.jd_from+task.span+k*0.25;
		double lo=0.0;
		double hi=0.0;
		if(scan(task,a,b,lo,hi)){
			jd=bisect(task,lo,hi);
			return true;
		}
		if(log){
			(*log)<<"[rise_set] no "<<(task.rising?"rise":"set")<<" of "
				  <<body_name(task.body)<<" in ["<<std::fixed
				  <<std::setprecision(5)<<a<<", "<<b<<"), widening"<<std::endl;
		}
	}
	return false;
}

double RsSolver::find(const RsTask&task,std::ostream*log){
	double jd=0.0;
	if(try_find(task,jd,log)){
		return jd;
	}
	ErrCtx ctx;
	ctx.jd_utc=task.jd_from;
	ctx.lat=loc.lat;
	ctx.lon=loc.lon;
	ctx.body=body_name(task.body);
	throw CalcError(ErrKind::NO_RISE_SET,
					std::string("no ")+(task.rising?"rise":"set")+
						" found after widening the search bracket",
					ctx);
}
