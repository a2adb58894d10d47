#pragma once

#include<memory>
#include<mutex>
#include<string>

#include "panchang/app_long.hpp"
#include "panchang/ephem.hpp"

// JPL SPK kernel provider. CSPICE is not thread-safe; calls are serialized.
class SpcProv : public EphemProv{
public:
	explicit SpcProv(const std::string&path);

	std::string name() const override;

	EclPos get_pos(Body b,const Instant&t) override;

	double cov_lo() const{ return eph_->cov_lo; }
	double cov_hi() const{ return eph_->cov_hi; }

private:
	int body_id(Body b) const;

	std::unique_ptr<EphRead> eph_;
	std::unique_ptr<AppLon> app_;
	std::mutex mtx_;
};
