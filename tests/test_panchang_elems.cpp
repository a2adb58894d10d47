#include "panchang/panchang.hpp"

#include<gtest/gtest.h>

#include<cmath>
#include<string>

#include "panchang/errors.hpp"

class PanElemsTest : public ::testing::Test{
protected:
	KarTab kt=KarTab::std_tab();
};

TEST_F(PanElemsTest,ScenarioWaxingEleventh){
	PanElems e=PanDeriv::elems(280.0,45.0,kt);
	EXPECT_NEAR(e.tithi.value,125.0/12.0,1e-12);
	EXPECT_EQ(e.tithi.num,11);
	EXPECT_EQ(e.tithi.paksha,Paksha::SHUKLA);
	EXPECT_EQ(e.tithi.name,"Shukla Ekadashi");
}

TEST_F(PanElemsTest,ScenarioConjunction){
	PanElems e=PanDeriv::elems(10.0,10.0,kt);
	EXPECT_DOUBLE_EQ(e.tithi.value,0.0);
	EXPECT_EQ(e.tithi.num,1);
	EXPECT_EQ(e.tithi.name,"Shukla Pratipad");
	EXPECT_EQ(e.phase.name,"New Moon");
	EXPECT_NEAR(e.phase.illum,0.0,1e-9);
	EXPECT_EQ(e.karana.name,"Kimstughna");
}

TEST_F(PanElemsTest,ScenarioOpposition){
	PanElems e=PanDeriv::elems(100.0,280.0,kt);
	EXPECT_EQ(e.phase.name,"Full Moon");
	EXPECT_NEAR(e.phase.illum,100.0,1e-9);
	EXPECT_EQ(e.tithi.num,16);
	EXPECT_EQ(e.tithi.paksha,Paksha::KRISHNA);
}

TEST_F(PanElemsTest,IndicesStayInRange){
	for(double s=0.0;s<360.0;s+=3.7){
		for(double m=0.0;m<360.0;m+=1.3){
			PanElems e=PanDeriv::elems(s,m,kt);
			ASSERT_GE(e.tithi.value,0.0);
			ASSERT_LT(e.tithi.value,30.0);
			ASSERT_GE(e.nak.idx,0);
			ASSERT_LT(e.nak.idx,27);
			ASSERT_GE(e.nak.pada,1);
			ASSERT_LE(e.nak.pada,4);
			ASSERT_GE(e.yoga.idx,0);
			ASSERT_LT(e.yoga.idx,27);
			ASSERT_GE(e.karana.idx,0);
			ASSERT_LT(e.karana.idx,60);
			ASSERT_GE(e.phase.idx,0);
			ASSERT_LT(e.phase.idx,8);
		}
	}
}

TEST_F(PanElemsTest,EdgeLongitudesWrap){
	PanElems e=PanDeriv::elems(359.9999999999,360.0,kt);
	EXPECT_LT(e.tithi.value,30.0);
	EXPECT_LT(e.nak.idx,27);
	e=PanDeriv::elems(-10.0,-370.0,kt);
	EXPECT_EQ(e.nak.idx,26);
	EXPECT_EQ(e.tithi.num,1);
}

TEST_F(PanElemsTest,KaranaCycle){
	EXPECT_EQ(kt.names.size(),11u);
	EXPECT_EQ(kt.name(0),"Kimstughna");
	EXPECT_EQ(kt.name(1),"Bava");
	EXPECT_EQ(kt.name(7),"Vishti");
	EXPECT_EQ(kt.name(8),"Bava");
	EXPECT_EQ(kt.name(56),"Vishti");
	EXPECT_EQ(kt.name(57),"Shakuni");
	EXPECT_EQ(kt.name(58),"Chatushpada");
	EXPECT_EQ(kt.name(59),"Naga");
	int vishti=0;
	for(int i=0;i<60;++i){
		if(kt.name(i)=="Vishti"){
			++vishti;
		}
	}
	EXPECT_EQ(vishti,8);
	EXPECT_EQ(kt.find("Naga"),9);
	EXPECT_EQ(kt.find("nothing"),-1);
}

TEST_F(PanElemsTest,KaalSegmentsTileTheDay){
	double rise=2460000.25;
	double set=2460000.7731;
	double total=0.0;
	for(int seg=0;seg<8;++seg){
		Span s=PanDeriv::kaal(rise,set,seg);
		EXPECT_GT(s.len(),0.0);
		total+=s.len();
	}
	EXPECT_NEAR(total,set-rise,1e-12);
	EXPECT_DOUBLE_EQ(PanDeriv::kaal(rise,set,0).st,rise);
	EXPECT_DOUBLE_EQ(PanDeriv::kaal(rise,set,7).ed,set);
}

TEST_F(PanElemsTest,KaalTablesPerWeekday){
	EXPECT_EQ(pan_tab::rahu_seg(0),7);
	EXPECT_EQ(pan_tab::rahu_seg(1),1);
	EXPECT_EQ(pan_tab::rahu_seg(6),2);
	EXPECT_EQ(pan_tab::gulika_seg(0),6);
	EXPECT_EQ(pan_tab::gulika_seg(6),0);
	EXPECT_EQ(pan_tab::yama_seg(0),4);
	EXPECT_EQ(pan_tab::yama_seg(4),0);
	for(int w=0;w<7;++w){
		EXPECT_NE(pan_tab::rahu_seg(w),pan_tab::gulika_seg(w));
		EXPECT_NE(pan_tab::rahu_seg(w),pan_tab::yama_seg(w));
	}
}

TEST_F(PanElemsTest,TraditionalYears){
	HinduYears y=PanDeriv::years_of(2024,5);
	EXPECT_EQ(y.vikram,2081);
	EXPECT_EQ(y.shaka,1946);
	EXPECT_EQ(y.kali,5126);
	y=PanDeriv::years_of(2024,1);
	EXPECT_EQ(y.vikram,2080);
	EXPECT_EQ(y.shaka,1945);
}

TEST_F(PanElemsTest,NameLookups){
	EXPECT_EQ(pan_tab::nak_find("Ashwini"),0);
	EXPECT_EQ(pan_tab::nak_find("Revati"),26);
	EXPECT_EQ(pan_tab::yoga_find("Vaidhriti"),26);
	EXPECT_EQ(pan_tab::nak_lord(0),"Ketu");
	EXPECT_EQ(pan_tab::vara_name(0),"Ravivara");
	EXPECT_EQ(pan_tab::rashi_name(11),"Meena");
}

TEST(CivilDateTest,RejectsImpossibleDays){
	try{
		Instant::from_civil(2023,2,31,12);
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::INVALID_INSTANT);
		EXPECT_NE(std::string(ex.what()).find("2023-2-31"),std::string::npos);
	}
	EXPECT_THROW(Instant::from_civil(2023,2,29),CalcError);
	EXPECT_THROW(Instant::from_civil(1900,2,29),CalcError);
	EXPECT_THROW(Instant::from_civil(2024,4,31),CalcError);
	EXPECT_NO_THROW(Instant::from_civil(2024,2,29));
	EXPECT_NO_THROW(Instant::from_civil(2000,2,29));
	EXPECT_NO_THROW(Instant::from_civil(2024,12,31,23,59,59.5));
}
