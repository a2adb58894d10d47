#include "panchang/config.hpp"

#include<gtest/gtest.h>

#include<filesystem>
#include<fstream>
#include<stdexcept>

#include "panchang/errors.hpp"

namespace fs=std::filesystem;

class ConfigTest : public ::testing::Test{
protected:
	void SetUp() override{
		dir=fs::temp_directory_path()/"panchang_cfg_test";
		fs::create_directories(dir);
		path=(dir/"panchang.cfg").string();
	}

	void TearDown() override{
		std::error_code ec;
		fs::remove_all(dir,ec);
	}

	void write(const std::string&text){
		std::ofstream ofs(path);
		ofs<<text;
	}

	fs::path dir;
	std::string path;
};

TEST_F(ConfigTest,DefaultsAreValid){
	EngCfg cfg;
	EXPECT_NO_THROW(chk_cfg(cfg));
	EXPECT_TRUE(cfg.ephem_path.empty());
	EXPECT_EQ(cfg.default_aya,"LAHIRI");
	EXPECT_DOUBLE_EQ(cfg.pan_ttl,1800.0);
	EXPECT_DOUBLE_EQ(cfg.muh_ttl,7200.0);
}

TEST_F(ConfigTest,SaveThenLoad){
	EngCfg cfg;
	cfg.default_aya="RAMAN";
	cfg.neutral_fav=0.4;
	cfg.workers=3;
	cfg.near_min=20.0;
	cfg.rule_ver="2024.1";
	cfg.muh_cap=17;
	cfg.day_ttl=3600.0;
	ASSERT_TRUE(save_cfg(cfg,path));
	EngCfg back;
	ASSERT_TRUE(load_cfg(back,path));
	EXPECT_EQ(back.default_aya,"RAMAN");
	EXPECT_DOUBLE_EQ(back.neutral_fav,0.4);
	EXPECT_EQ(back.workers,3);
	EXPECT_DOUBLE_EQ(back.near_min,20.0);
	EXPECT_EQ(back.rule_ver,"2024.1");
	EXPECT_EQ(back.muh_cap,17u);
	EXPECT_DOUBLE_EQ(back.day_ttl,3600.0);
}

TEST_F(ConfigTest,TrimsAndIgnoresUnknownKeys){
	write("# engine settings\n"
		  "  default_aya =  kp  \n"
		  "colour=blue\n"
		  "no separator here\n"
		  "pan_ttl=60\n");
	EngCfg cfg;
	ASSERT_TRUE(load_cfg(cfg,path));
	EXPECT_EQ(cfg.default_aya,"kp");
	EXPECT_DOUBLE_EQ(cfg.pan_ttl,60.0);
}

TEST_F(ConfigTest,MissingFileLeavesDefaults){
	EngCfg cfg;
	EXPECT_FALSE(load_cfg(cfg,(dir/"absent.cfg").string()));
	EXPECT_EQ(cfg.rule_ver,"1");
}

TEST_F(ConfigTest,RejectsBadValues){
	EngCfg cfg;
	write("neutral_fav=half\n");
	EXPECT_THROW(load_cfg(cfg,path),std::invalid_argument);
	write("neutral_fav=1.5\n");
	EngCfg c2;
	EXPECT_THROW(load_cfg(c2,path),std::invalid_argument);
	write("aya_cap=0\n");
	EngCfg c3;
	EXPECT_THROW(load_cfg(c3,path),std::invalid_argument);
	write("default_aya=NOPE\n");
	EngCfg c4;
	EXPECT_THROW(load_cfg(c4,path),std::invalid_argument);
}

TEST_F(ConfigTest,ProviderSelection){
	EngCfg cfg;
	auto p=open_prov(cfg);
	ASSERT_TRUE(p);
	EXPECT_EQ(p->name(),"analytic");
	cfg.ephem_path=(dir/"missing.bsp").string();
	try{
		open_prov(cfg);
		FAIL()<<"expected CalcError";
	}catch(const CalcError&ex){
		EXPECT_EQ(ex.kind(),ErrKind::EPHEM_UNAVAIL);
	}
}

TEST(TrimTest,StripsBothEnds){
	EXPECT_EQ(trim("  a b \t\n"),"a b");
	EXPECT_EQ(trim(""),"");
	EXPECT_EQ(trim("   "),"");
}
