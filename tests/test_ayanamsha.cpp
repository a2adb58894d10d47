#include "panchang/ayanamsha.hpp"

#include<gtest/gtest.h>

#include<stdexcept>

#include "panchang/errors.hpp"
#include "panchang/math.hpp"

class AyanamshaTest : public ::testing::Test{
protected:
	AyaEng eng;
};

TEST_F(AyanamshaTest,SiderealTropicalRoundTrip){
	const int years[]={-400,600,1900,2000,2024,2450};
	const double lons[]={0.0,1e-7,0.5,123.456789,270.0,359.9999999};
	for(AyaSys s : AyaEng::all_sys()){
		for(int y : years){
			Instant t=Instant::from_civil(y,6,15,12);
			for(double L : lons){
				double back=eng.to_tropical(eng.to_sidereal(L,s,t),s,t);
				EXPECT_NEAR(norm180(back-L),0.0,1e-9)
					<<AyaEng::code(s)<<" year "<<y<<" lon "<<L;
			}
		}
	}
}

TEST_F(AyanamshaTest,SiderealStaysInRange){
	Instant t=Instant::from_civil(2024,1,1);
	for(AyaSys s : AyaEng::all_sys()){
		for(double L=0.0;L<360.0;L+=7.5){
			double sid=eng.to_sidereal(L,s,t);
			EXPECT_GE(sid,0.0);
			EXPECT_LT(sid,360.0);
		}
	}
}

TEST_F(AyanamshaTest,LahiriAtJ2000){
	AyaVal v=eng.value(AyaSys::LAHIRI,Instant::from_utc(J2000));
	EXPECT_NEAR(v.deg,23.857,0.01);
	EXPECT_FALSE(v.extrap);
}

TEST_F(AyanamshaTest,PrecessionGrowsWithTime){
	Instant a=Instant::from_civil(1900,1,1);
	Instant b=Instant::from_civil(2100,1,1);
	for(AyaSys s : AyaEng::all_sys()){
		double da=eng.value(s,a).deg;
		double db=eng.value(s,b).deg;
		// roughly 50 arcsec per year over two centuries
		EXPECT_NEAR(db-da,200.0*50.3/3600.0,0.25)<<AyaEng::code(s);
	}
}

TEST_F(AyanamshaTest,ExtrapolationIsFlagged){
	EXPECT_FALSE(eng.value(AyaSys::RAMAN,Instant::from_civil(2000,1,1)).extrap);
	EXPECT_TRUE(eng.value(AyaSys::RAMAN,Instant::from_civil(2800,1,1)).extrap);
	EXPECT_TRUE(eng.value(AyaSys::LAHIRI,Instant::from_civil(-1500,1,1)).extrap);
}

TEST_F(AyanamshaTest,ExtrapolationIsContinuousAtBoundary){
	Instant in=Instant::from_civil(2499,12,31);
	Instant out=Instant::from_civil(2500,1,2);
	double a=eng.value(AyaSys::LAHIRI,in).deg;
	double b=eng.value(AyaSys::LAHIRI,out).deg;
	EXPECT_NEAR(b-a,0.0,0.001);
}

TEST_F(AyanamshaTest,ParseKnownNamesAndAliases){
	EXPECT_EQ(AyaEng::parse("LAHIRI"),AyaSys::LAHIRI);
	EXPECT_EQ(AyaEng::parse("lahiri"),AyaSys::LAHIRI);
	EXPECT_EQ(AyaEng::parse("Chitrapaksha"),AyaSys::LAHIRI);
	EXPECT_EQ(AyaEng::parse("KP"),AyaSys::KRISHNAMURTI);
	for(AyaSys s : AyaEng::all_sys()){
		EXPECT_EQ(AyaEng::parse(AyaEng::code(s)),s);
	}
}

TEST_F(AyanamshaTest,UnknownSystemFails){
	try{
		AyaEng::parse("NOT_A_SYSTEM");
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::UNKNOWN_AYANAMSHA);
		EXPECT_EQ(ex.ctx().system,"NOT_A_SYSTEM");
	}
}

TEST_F(AyanamshaTest,CompareAllCoversEverySystem){
	auto all=eng.compare_all(Instant::from_civil(2024,3,20));
	EXPECT_EQ(all.size(),10u);
	for(const auto&kv : all){
		EXPECT_GT(kv.second.deg,20.0);
		EXPECT_LT(kv.second.deg,30.0);
	}
}

TEST_F(AyanamshaTest,SeriesRejectsBadStep){
	EXPECT_THROW(eng.series(AyaSys::LAHIRI,1900,2000,0),std::invalid_argument);
	EXPECT_THROW(eng.series(AyaSys::LAHIRI,2000,1900,10),std::invalid_argument);
	auto s=eng.series(AyaSys::LAHIRI,1900,2000,25);
	ASSERT_EQ(s.size(),5u);
	EXPECT_EQ(s.front().first,1900);
	EXPECT_EQ(s.back().first,2000);
}

TEST_F(AyanamshaTest,InfoAndDiff){
	const AyaDef&d=eng.info(AyaSys::LAHIRI);
	EXPECT_EQ(d.sys,AyaSys::LAHIRI);
	EXPECT_EQ(d.code,"LAHIRI");
	EXPECT_FALSE(d.desc.empty());
	EXPECT_LT(d.yr_lo,d.yr_hi);

	Instant t=Instant::from_civil(2024,1,1);
	double fl=eng.diff(AyaSys::FAGAN_BRADLEY,AyaSys::LAHIRI,t);
	EXPECT_NEAR(fl,eng.value(AyaSys::FAGAN_BRADLEY,t).deg-
					   eng.value(AyaSys::LAHIRI,t).deg,
				1e-12);
	EXPECT_NEAR(fl,0.88,0.05);
	EXPECT_NEAR(eng.diff(AyaSys::LAHIRI,AyaSys::FAGAN_BRADLEY,t),-fl,1e-12);
	EXPECT_DOUBLE_EQ(eng.diff(AyaSys::RAMAN,AyaSys::RAMAN,t),0.0);
}
