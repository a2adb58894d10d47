#include "panchang/muhurta.hpp"

#include<gtest/gtest.h>

#include<atomic>
#include<set>
#include<sstream>
#include<stdexcept>

#include "fake_prov.hpp"
#include "panchang/errors.hpp"

namespace{

class FailSrc : public PanSrc{
public:
	PanchangResult panchang_at(const Location&loc,const Instant&t,
							   AyaSys) override{
		ErrCtx ctx;
		ctx.jd_utc=t.jd_utc;
		ctx.lat=loc.lat;
		ctx.lon=loc.lon;
		throw CalcError(ErrKind::NO_RISE_SET,"polar day",ctx);
	}
};

}

class MuhurtaTest : public ::testing::Test{
protected:
	void SetUp() override{
		src.snap=good_snap();
		q.ev=MuhEvent::MARRIAGE;
		q.loc=Location::make(28.6139,77.2090,0.0,330);
		q.jd_from=Instant::from_civil(2024,1,15,0,0,0,330).jd_utc;
		q.jd_to=q.jd_from+1.0;
		q.step_min=30.0;
		step=q.step_min/MIN_DAY;
	}

	RuleSet rs=RuleSet::std_set("1");
	FixedSrc src;
	MuhQuery q;
	double step=0.0;
};

TEST_F(MuhurtaTest,TierBandsAreExhaustive){
	Tier prev=Tier::AVOID;
	for(int s=0;s<=100;++s){
		Tier t=tier_of(s);
		EXPECT_GE(t,prev);
		prev=t;
	}
	EXPECT_EQ(tier_of(0),Tier::AVOID);
	EXPECT_EQ(tier_of(39),Tier::AVOID);
	EXPECT_EQ(tier_of(40),Tier::POOR);
	EXPECT_EQ(tier_of(49),Tier::POOR);
	EXPECT_EQ(tier_of(50),Tier::AVERAGE);
	EXPECT_EQ(tier_of(59),Tier::AVERAGE);
	EXPECT_EQ(tier_of(60),Tier::GOOD);
	EXPECT_EQ(tier_of(69),Tier::GOOD);
	EXPECT_EQ(tier_of(70),Tier::VERY_GOOD);
	EXPECT_EQ(tier_of(79),Tier::VERY_GOOD);
	EXPECT_EQ(tier_of(80),Tier::EXCELLENT);
	EXPECT_EQ(tier_of(100),Tier::EXCELLENT);
	EXPECT_EQ(parse_tier("Very Good"),Tier::VERY_GOOD);
	EXPECT_THROW(parse_tier("Great"),std::invalid_argument);
}

TEST_F(MuhurtaTest,EveryEventHasARule){
	EXPECT_EQ(rs.rules.size(),all_events().size());
	for(MuhEvent ev : all_events()){
		const MuhRule&r=rs.find(ev);
		EXPECT_EQ(r.ver,"1");
		EXPECT_TRUE(r.excludes(Excl::RAHU_KAAL))<<r.name;
		double w=0.0;
		for(const auto&kv : r.fac){
			w+=kv.second.weight;
		}
		EXPECT_NEAR(w,0.85,1e-12)<<r.name;
		EXPECT_FALSE(r.planets.empty())<<r.name;
	}
	EXPECT_TRUE(rs.find(MuhEvent::MARRIAGE).excludes(Excl::VISHTI_KARANA));
	EXPECT_TRUE(rs.find(MuhEvent::PROPERTY).excludes(Excl::GULIKA_KAAL));
	EXPECT_FALSE(rs.find(MuhEvent::TRAVEL).excludes(Excl::YAMAGANDA_KAAL));
}

TEST_F(MuhurtaTest,EventNamesParse){
	EXPECT_EQ(parse_event("Marriage"),MuhEvent::MARRIAGE);
	EXPECT_EQ(parse_event("general"),MuhEvent::GENERAL);
	EXPECT_THROW(parse_event("party"),std::invalid_argument);
}

TEST_F(MuhurtaTest,PlanetDignity){
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::JUPITER,95.0),1.0);
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::JUPITER,250.0),0.8);
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::JUPITER,275.0),0.2);
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::JUPITER,50.0),0.5);
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::MERCURY,155.0),1.0);
	EXPECT_DOUBLE_EQ(MuhScorer::planet_str(Body::MERCURY,340.0),0.2);
}

TEST_F(MuhurtaTest,AllFavourableScoresFull){
	MuhScorer sc(src);
	MuhCand c=sc.score(rs.find(MuhEvent::MARRIAGE),good_snap(),q.jd_from,
					   q.jd_from+step);
	EXPECT_EQ(c.score,100);
	EXPECT_EQ(c.tier,Tier::EXCELLENT);
	EXPECT_FALSE(c.excluded);
	EXPECT_TRUE(c.warnings.empty());
	EXPECT_EQ(c.factors.size(),7u);
	for(const auto&f : c.factors){
		EXPECT_EQ(f.verdict,"helped")<<factor_name(f.fac);
	}
}

TEST_F(MuhurtaTest,UnfavourableWeekdayLowersScore){
	MuhScorer sc(src);
	PanchangResult p=good_snap();
	p.vara.idx=2;
	p.vara.name="Mangalavara";
	MuhCand c=sc.score(rs.find(MuhEvent::MARRIAGE),p,q.jd_from,q.jd_from+step);
	EXPECT_EQ(c.score,88);
	EXPECT_EQ(c.tier,Tier::EXCELLENT);
	EXPECT_NE(c.summary.find("hurt by vara"),std::string::npos);
}

TEST_F(MuhurtaTest,NeutralValuesScoreTheMidpoint){
	MuhRule r;
	r.name="plain";
	r.fac[Factor::TITHI].weight=1.0;
	r.fac[Factor::VARA].weight=2.0;
	MuhScorer sc(src);
	MuhCand c=sc.score(r,good_snap(),q.jd_from,q.jd_from+step);
	EXPECT_EQ(c.score,50);
	EXPECT_EQ(c.tier,Tier::AVERAGE);
	ASSERT_EQ(c.factors.size(),2u);
	EXPECT_EQ(c.factors[0].verdict,"neutral");
}

TEST_F(MuhurtaTest,RahuKaalDominatesFavourableFactors){
	MuhScorer sc(src);
	PanchangResult p=good_snap();
	p.rahu.st=q.jd_from+0.2*step;
	p.rahu.ed=q.jd_from+4.0*step;
	for(MuhEvent ev : all_events()){
		MuhCand c=sc.score(rs.find(ev),p,q.jd_from,q.jd_from+step);
		EXPECT_EQ(c.score,0)<<event_name(ev);
		EXPECT_EQ(c.tier,Tier::AVOID);
		EXPECT_TRUE(c.excluded);
		ASSERT_FALSE(c.warnings.empty());
		EXPECT_NE(c.warnings[0].find("Rahu Kaal"),std::string::npos);
	}
}

TEST_F(MuhurtaTest,VishtiExcludesMarriageButNotTravel){
	MuhScorer sc(src);
	PanchangResult p=good_snap();
	p.karana.kind=6;
	p.karana.name="Vishti";
	EXPECT_EQ(sc.score(rs.find(MuhEvent::MARRIAGE),p,q.jd_from,q.jd_from+step)
				  .score,
			  0);
	MuhCand t=sc.score(rs.find(MuhEvent::TRAVEL),p,q.jd_from,q.jd_from+step);
	EXPECT_FALSE(t.excluded);
	EXPECT_GT(t.score,0);
}

TEST_F(MuhurtaTest,GulikaOverlapWarnsWithoutExcludingMarriage){
	MuhScorer sc(src);
	PanchangResult p=good_snap();
	p.gulika.st=q.jd_from;
	p.gulika.ed=q.jd_from+3.0*step;
	MuhCand c=sc.score(rs.find(MuhEvent::MARRIAGE),p,q.jd_from,q.jd_from+step);
	EXPECT_EQ(c.score,100);
	ASSERT_EQ(c.warnings.size(),1u);
	EXPECT_NE(c.warnings[0].find("Gulika"),std::string::npos);
	MuhCand pr=sc.score(rs.find(MuhEvent::PROPERTY),p,q.jd_from,
						q.jd_from+step);
	EXPECT_EQ(pr.score,0);
}

TEST_F(MuhurtaTest,NearBoundaryAndNakshatraWarnings){
	MuhScorer sc(src,1,15.0);
	PanchangResult p=good_snap();
	p.rahu.st=q.jd_from+step+10.0/MIN_DAY;
	p.rahu.ed=p.rahu.st+0.06;
	p.nak.idx=18;
	p.nak.name="Mula";
	p.panchaka=true;
	p.panchaka_kind="Roga";
	MuhCand c=sc.score(rs.find(MuhEvent::MARRIAGE),p,q.jd_from,q.jd_from+step);
	EXPECT_FALSE(c.excluded);
	std::string all;
	for(const auto&w : c.warnings){
		all+=w+"|";
	}
	EXPECT_NE(all.find("within 15 min of Rahu Kaal"),std::string::npos);
	EXPECT_NE(all.find("Ganda Moola"),std::string::npos);
	EXPECT_NE(all.find("Panchaka (Roga)"),std::string::npos);
}

TEST_F(MuhurtaTest,OneRahuSegmentInADaySearch){
	src.snap.rahu.st=q.jd_from+10.5*step;
	src.snap.rahu.ed=q.jd_from+13.5*step;
	MuhScorer sc(src,4);
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	EXPECT_FALSE(s.partial);
	EXPECT_EQ(s.n_total,48u);
	EXPECT_EQ(s.n_eval,48u);
	ASSERT_EQ(s.cands.size(),48u);
	int good=0;
	int inside=0;
	for(const auto&c : s.cands){
		ASSERT_GE(c.score,0);
		ASSERT_LE(c.score,100);
		if(src.snap.rahu.overlaps(c.st,c.ed)){
			++inside;
			EXPECT_EQ(c.score,0);
		}else if(c.tier!=Tier::AVOID){
			++good;
		}
	}
	EXPECT_EQ(inside,4);
	EXPECT_EQ(good,44);
}

TEST_F(MuhurtaTest,RankingIsDeterministic){
	src.snap.rahu.st=q.jd_from+10.5*step;
	src.snap.rahu.ed=q.jd_from+13.5*step;
	MuhScorer sc(src,3);
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	for(std::size_t i=1;i<s.cands.size();++i){
		const MuhCand&a=s.cands[i-1];
		const MuhCand&b=s.cands[i];
		ASSERT_TRUE(a.score>b.score||(a.score==b.score&&a.st<b.st));
	}
	EXPECT_DOUBLE_EQ(s.cands.front().st,q.jd_from);
	EXPECT_EQ(s.cands.back().score,0);
}

TEST_F(MuhurtaTest,MinTierAndMaxResults){
	src.snap.rahu.st=q.jd_from+10.5*step;
	src.snap.rahu.ed=q.jd_from+13.5*step;
	MuhScorer sc(src,2);
	q.min_tier=Tier::GOOD;
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	EXPECT_EQ(s.cands.size(),44u);
	q.max_res=5;
	s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	ASSERT_EQ(s.cands.size(),5u);
	for(std::size_t i=0;i<5;++i){
		EXPECT_NEAR(s.cands[i].st,q.jd_from+static_cast<double>(i)*step,1e-9);
	}
}

TEST_F(MuhurtaTest,RangeShorterThanStepIsEmpty){
	MuhScorer sc(src);
	q.jd_to=q.jd_from+20.0/MIN_DAY;
	try{
		sc.search(rs.find(MuhEvent::MARRIAGE),q);
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::EMPTY_WINDOW);
	}
	q.jd_to=q.jd_from+1.0;
	q.step_min=0.0;
	try{
		sc.search(rs.find(MuhEvent::MARRIAGE),q);
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::EMPTY_WINDOW);
	}
	EXPECT_EQ(src.calls.load(),0);
}

TEST_F(MuhurtaTest,ExactStepFitsOneSample){
	MuhScorer sc(src);
	q.jd_to=q.jd_from+step;
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	EXPECT_EQ(s.n_total,1u);
}

TEST_F(MuhurtaTest,BusyPeriodsAreSkipped){
	MuhScorer sc(src,2);
	q.skip.push_back({q.jd_from-0.1,q.jd_from+1.9/24.0});
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q);
	EXPECT_EQ(s.n_total,44u);
	for(const auto&c : s.cands){
		EXPECT_GE(c.st,q.jd_from+4.0*step-1e-9);
	}
}

TEST_F(MuhurtaTest,StopFlagReturnsPartial){
	std::atomic<bool> stop{false};
	src.stop_after=&stop;
	src.stop_at=5;
	std::ostringstream log;
	MuhScorer sc(src,1,15.0,&log);
	MuhSearch s=sc.search(rs.find(MuhEvent::MARRIAGE),q,&stop);
	EXPECT_TRUE(s.partial);
	EXPECT_EQ(s.n_eval,5u);
	EXPECT_EQ(s.n_total,48u);
	EXPECT_EQ(s.cands.size(),5u);
	EXPECT_NE(log.str().find("stopped after 5/48"),std::string::npos);
}

TEST_F(MuhurtaTest,SampleFailurePropagates){
	FailSrc bad;
	MuhScorer sc(bad,4);
	try{
		sc.search(rs.find(MuhEvent::MARRIAGE),q);
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::NO_RISE_SET);
		EXPECT_NEAR(ex.ctx().lat,28.6139,1e-9);
	}
}

TEST_F(MuhurtaTest,BestSkipsExcludedWindows){
	src.snap.rahu.st=q.jd_from-0.01;
	src.snap.rahu.ed=q.jd_from+2.5*step;
	MuhScorer sc(src);
	MuhCand c;
	ASSERT_TRUE(sc.best(rs.find(MuhEvent::MARRIAGE),q,c));
	EXPECT_NEAR(c.st,q.jd_from+3.0*step,1e-9);
	src.snap.rahu.ed=q.jd_to+1.0;
	EXPECT_FALSE(sc.best(rs.find(MuhEvent::MARRIAGE),q,c));
}

TEST_F(MuhurtaTest,CalendarGroupsByLocalDay){
	MuhScorer sc(src,2);
	q.jd_to=q.jd_from+3.0;
	std::vector<MuhDay> days=sc.calendar(rs.find(MuhEvent::MARRIAGE),q,2);
	ASSERT_EQ(days.size(),3u);
	EXPECT_EQ(days[0].date,"2024-01-15");
	EXPECT_EQ(days[2].date,"2024-01-17");
	std::set<std::string> seen;
	for(const auto&d : days){
		EXPECT_EQ(d.cands.size(),2u);
		seen.insert(d.date);
		for(const auto&c : d.cands){
			EXPECT_GE(c.st,d.day_start-1e-9);
			EXPECT_LE(c.ed,d.day_start+1.0+1e-9);
		}
	}
	EXPECT_EQ(seen.size(),3u);
}
