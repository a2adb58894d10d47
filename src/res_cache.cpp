#include "panchang/res_cache.hpp"

#include<chrono>
#include<cstdio>

double mono_sec(){
	using namespace std::chrono;
	return duration<double>(steady_clock::now().time_since_epoch()).count();
}

KeyBld::KeyBld(const std::string&ns) : key_(ns){}

KeyBld&KeyBld::add(double v){
	char buf[64];
	std::snprintf(buf,sizeof(buf),"%.6f",v);
	key_+=":";
	key_+=buf;
	return *this;
}

KeyBld&KeyBld::add(int v){
	key_+=":"+std::to_string(v);
	return *this;
}

KeyBld&KeyBld::add(const std::string&v){
	key_+=":"+v;
	return *this;
}
