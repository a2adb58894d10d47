#pragma once

#include<string>

#include "panchang/ephem.hpp"

// Series-based provider: Meeus solar theory, the truncated ELP-2000/82 lunar
// series and Standish mean elements for the planets. Accuracy is of the order
// of 0.01 deg for the Sun, 0.003 deg for the Moon and a few arcminutes for the
// planets, which is enough for day-level Panchang work without a kernel.
class AnaProv : public EphemProv{
public:
	AnaProv();

	std::string name() const override;

	EclPos get_pos(Body b,const Instant&t) override;

	static EclPos sun_pos(double T);

	static EclPos moon_pos(double T);

	static EclPos planet_pos(Body b,double T);

	double max_abs_jc;
};
