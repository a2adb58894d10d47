#pragma once

#include<cstddef>
#include<memory>
#include<string>

#include "panchang/ephem.hpp"

struct EngCfg{
	// empty selects the analytic provider
	std::string ephem_path;
	std::string default_aya="LAHIRI";
	double neutral_fav=0.5;
	// 0 picks hardware concurrency
	int workers=0;
	double near_min=15.0;
	std::string rule_ver="1";

	std::size_t aya_cap=4096;
	double aya_ttl=0.0;
	std::size_t day_cap=1024;
	double day_ttl=86400.0;
	std::size_t pan_cap=2048;
	double pan_ttl=1800.0;
	std::size_t muh_cap=256;
	double muh_ttl=7200.0;
};

extern const std::string CFG_FILE;

std::string trim(const std::string&s);

// false when the file cannot be opened; throws std::invalid_argument on a
// malformed value
bool load_cfg(EngCfg&cfg,const std::string&path=CFG_FILE);

bool save_cfg(const EngCfg&cfg,const std::string&path=CFG_FILE);

// throws std::invalid_argument
void chk_cfg(const EngCfg&cfg);

std::unique_ptr<EphemProv> open_prov(const EngCfg&cfg);
