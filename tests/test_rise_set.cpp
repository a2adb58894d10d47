#include "panchang/rise_set.hpp"

#include<gtest/gtest.h>

#include<cmath>
#include<sstream>

#include "panchang/ana_ephem.hpp"
#include "panchang/errors.hpp"

class RiseSetTest : public ::testing::Test{
protected:
	AnaProv eph;
	Location grw=Location::make(51.4769,0.0,0.0,0);
};

TEST_F(RiseSetTest,HorizonTargets){
	EXPECT_DOUBLE_EQ(RsSolver::sun_h0(0.0),-0.833);
	EXPECT_LT(RsSolver::sun_h0(1000.0),-0.833-1.0);
	// mean lunar parallax near 0.95 deg puts the target close to -0.82
	EXPECT_NEAR(RsSolver::moon_h0(0.95,0.0),-0.826,0.01);
}

TEST_F(RiseSetTest,EquinoxSunriseAtGreenwich){
	RsSolver rs(eph,grw);
	double day=Instant::from_civil(2024,3,20).jd_utc;
	double h0=RsSolver::sun_h0(0.0);
	double rise=rs.find({Body::SUN,true,day,1.0,h0,true});
	double set=rs.find({Body::SUN,false,rise,1.0,h0,false});
	CivilDT r=CivilDT::from_utc(rise,0);
	CivilDT s=CivilDT::from_utc(set,0);
	EXPECT_EQ(r.hour,6);
	EXPECT_EQ(s.hour,18);
	EXPECT_NEAR((set-rise)*24.0,12.2,0.15);
	EXPECT_NEAR(eph.get_altitude(Body::SUN,Instant::from_utc(rise),grw),h0,
				0.02);
}

TEST_F(RiseSetTest,RootIsBracketedToTolerance){
	RsSolver rs(eph,grw);
	double day=Instant::from_civil(2024,6,1).jd_utc;
	RsTask task{Body::SUN,false,day,1.0,RsSolver::sun_h0(0.0),false};
	double lo=0.0;
	double hi=0.0;
	ASSERT_TRUE(rs.scan(task,day,day+1.0,lo,hi));
	EXPECT_LE(hi-lo,rs.scan_step+1e-12);
	double root=rs.bisect(task,lo,hi);
	EXPECT_GE(root,lo);
	EXPECT_LE(root,hi);
	EXPECT_LT(std::fabs(rs.alt_fn(task,root)),0.01);
}

TEST_F(RiseSetTest,MoonRisesWithinTwoDays){
	RsSolver rs(eph,grw);
	double day=Instant::from_civil(2024,2,10).jd_utc;
	double hp=eph.hor_parallax(Body::MOON,Instant::from_utc(day+0.5));
	EXPECT_GT(hp,0.85);
	EXPECT_LT(hp,1.05);
	double rise=rs.find({Body::MOON,true,day,1.0,RsSolver::moon_h0(hp,0.0),
						 false});
	EXPECT_GE(rise,day);
	EXPECT_LT(rise,day+1.5);
}

TEST_F(RiseSetTest,WideningIsLoggedBeforeFailing){
	Location pole=Location::make(89.0,0.0,0.0,0);
	RsSolver rs(eph,pole);
	std::ostringstream log;
	double day=Instant::from_civil(2024,12,21).jd_utc;
	EXPECT_THROW(rs.find({Body::SUN,true,day,1.0,RsSolver::sun_h0(0.0),true},
						 &log),
				 CalcError);
	EXPECT_NE(log.str().find("widening"),std::string::npos);
}
