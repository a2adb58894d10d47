#include "panchang/config.hpp"

#include<cctype>
#include<fstream>
#include<iomanip>
#include<stdexcept>

#include "panchang/ana_ephem.hpp"
#include "panchang/ayanamsha.hpp"
#include "panchang/errors.hpp"
#include "panchang/spc_prov.hpp"

const std::string CFG_FILE="panchang.cfg";

namespace{

double to_num(const std::string&key,const std::string&value){
	std::size_t used=0;
	double v=0.0;
	try{
		v=std::stod(value,&used);
	}catch(const std::logic_error&){
		throw std::invalid_argument("config "+key+": not a number '"+value+
									"'");
	}
	if(used!=value.size()){
		throw std::invalid_argument("config "+key+": trailing text in '"+
									value+"'");
	}
	return v;
}

std::size_t to_cap(const std::string&key,const std::string&value){
	double v=to_num(key,value);
	if(v<1.0||v!=static_cast<double>(static_cast<long long>(v))){
		throw std::invalid_argument("config "+key+
									": capacity must be a positive integer");
	}
	return static_cast<std::size_t>(v);
}

}

std::string trim(const std::string&s){
	std::size_t start=0;
	while(start<s.size()&&std::isspace(static_cast<unsigned char>(s[start]))){
		++start;
	}
	std::size_t end=s.size();
	while(end>start&&std::isspace(static_cast<unsigned char>(s[end-1]))){
		--end;
	}
	return s.substr(start,end-start);
}

bool load_cfg(EngCfg&cfg,const std::string&path){
	std::ifstream ifs(path);
	if(!ifs){
		return false;
	}
	std::string line;
	while(std::getline(ifs,line)){
		std::string t=trim(line);
		if(t.empty()||t[0]=='#'){
			continue;
		}
		auto pos=t.find('=');
		if(pos==std::string::npos){
			continue;
		}
		std::string key=trim(t.substr(0,pos));
		std::string value=trim(t.substr(pos+1));
		if(key=="ephem_path"){
			cfg.ephem_path=value;
		}else if(key=="default_aya"){
			cfg.default_aya=value;
		}else if(key=="neutral_fav"){
			cfg.neutral_fav=to_num(key,value);
		}else if(key=="workers"){
			cfg.workers=static_cast<int>(to_num(key,value));
		}else if(key=="near_min"){
			cfg.near_min=to_num(key,value);
		}else if(key=="rule_ver"){
			cfg.rule_ver=value;
		}else if(key=="aya_cap"){
			cfg.aya_cap=to_cap(key,value);
		}else if(key=="aya_ttl"){
			cfg.aya_ttl=to_num(key,value);
		}else if(key=="day_cap"){
			cfg.day_cap=to_cap(key,value);
		}else if(key=="day_ttl"){
			cfg.day_ttl=to_num(key,value);
		}else if(key=="pan_cap"){
			cfg.pan_cap=to_cap(key,value);
		}else if(key=="pan_ttl"){
			cfg.pan_ttl=to_num(key,value);
		}else if(key=="muh_cap"){
			cfg.muh_cap=to_cap(key,value);
		}else if(key=="muh_ttl"){
			cfg.muh_ttl=to_num(key,value);
		}
	}
	chk_cfg(cfg);
	return true;
}

bool save_cfg(const EngCfg&cfg,const std::string&path){
	std::ofstream ofs(path);
	if(!ofs){
		return false;
	}
	ofs<<std::setprecision(17);
	ofs<<"ephem_path="<<cfg.ephem_path<<"\n";
	ofs<<"default_aya="<<cfg.default_aya<<"\n";
	ofs<<"neutral_fav="<<cfg.neutral_fav<<"\n";
	ofs<<"workers="<<cfg.workers<<"\n";
	ofs<<"near_min="<<cfg.near_min<<"\n";
	ofs<<"rule_ver="<<cfg.rule_ver<<"\n";
	ofs<<"aya_cap="<<cfg.aya_cap<<"\n";
	ofs<<"aya_ttl="<<cfg.aya_ttl<<"\n";
	ofs<<"day_cap="<<cfg.day_cap<<"\n";
	ofs<<"day_ttl="<<cfg.day_ttl<<"\n";
	ofs<<"pan_cap="<<cfg.pan_cap<<"\n";
	ofs<<"pan_ttl="<<cfg.pan_ttl<<"\n";
	ofs<<"muh_cap="<<cfg.muh_cap<<"\n";
	ofs<<"muh_ttl="<<cfg.muh_ttl<<"\n";
	return static_cast<bool>(ofs);
}

void chk_cfg(const EngCfg&cfg){
	if(!(cfg.neutral_fav>=0.0&&cfg.neutral_fav<=1.0)){
		throw std::invalid_argument("config neutral_fav must be in [0,1]");
	}
	if(cfg.workers<0){
		throw std::invalid_argument("config workers must not be negative");
	}
	if(!(cfg.near_min>=0.0)){
		throw std::invalid_argument("config near_min must not be negative");
	}
	if(cfg.rule_ver.empty()){
		throw std::invalid_argument("config rule_ver must not be empty");
	}
	if(cfg.aya_cap==0||cfg.day_cap==0||cfg.pan_cap==0||cfg.muh_cap==0){
		throw std::invalid_argument("config cache capacities must be positive");
	}
	try{
		AyaEng::parse(cfg.default_aya);
	}catch(const CalcError&ex){
		throw std::invalid_argument("config default_aya: "+ex.detail());
	}
}

std::unique_ptr<EphemProv> open_prov(const EngCfg&cfg){
	if(cfg.ephem_path.empty()){
		return std::make_unique<AnaProv>();
	}
	return std::make_unique<SpcProv>(cfg.ephem_path);
}
