#pragma once

#include<cstddef>
#include<cstdint>
#include<exception>
#include<functional>
#include<future>
#include<list>
#include<memory>
#include<mutex>
#include<string>
#include<unordered_map>
#include<utility>

struct CacheStats{
	std::uint64_t hits=0;
	std::uint64_t misses=0;
	std::uint64_t computes=0;
	std::uint64_t waits=0;
	std::uint64_t evictions=0;
	std::uint64_t expirations=0;
	std::size_t size=0;
	std::size_t capacity=0;
};

// seconds on a monotonic clock
double mono_sec();

// Builds cache keys; numbers are written with six decimals.
class KeyBld{
public:
	explicit KeyBld(const std::string&ns);

	KeyBld&add(double v);
	KeyBld&add(int v);
	KeyBld&add(const std::string&v);

	std::string str() const{ return key_; }

private:
	std::string key_;
};

// LRU cache with per-entry TTL and single-flight computation.
// ttl_s<=0 means entries never expire.
template<typename V>
class ResCache{
public:
	using Clock=std::function<double()>;

	ResCache(std::size_t cap,double ttl_s,Clock clk=mono_sec)
		: cap_(cap==0?1:cap),ttl_(ttl_s),clk_(std::move(clk)){}

	ResCache(const ResCache&)=delete;
	ResCache&operator=(const ResCache&)=delete;

	bool get(const std::string&key,V&out){
		std::lock_guard<std::mutex> lock(mtx_);
		if(lookup(key,out)){
			++st_.hits;
			return true;
		}
		++st_.misses;
		return false;
	}

	void put(const std::string&key,V val){ put(key,std::move(val),ttl_); }

	void put(const std::string&key,V val,double ttl_s){
		std::lock_guard<std::mutex> lock(mtx_);
		store(key,std::move(val),ttl_s);
	}

	// Returns the cached value or runs fn once for all concurrent callers of
	// key. A throwing fn reaches every waiter and nothing is stored.
	template<typename Fn>
	V get_or(const std::string&key,Fn&&fn){
		std::shared_future<V> fut;
		std::shared_ptr<std::promise<V>> prom;
		{
			std::lock_guard<std::mutex> lock(mtx_);
			V hit;
			if(lookup(key,hit)){
				++st_.hits;
				return hit;
			}
			++st_.misses;
			auto it=flight_.find(key);
			if(it!=flight_.end()){
				++st_.waits;
				fut=it->second;
			}else{
				prom=std::make_shared<std::promise<V>>();
				fut=prom->get_future().share();
				flight_.emplace(key,fut);
				++st_.computes;
			}
		}
		if(!prom){
			return fut.get();
		}

		try{
			V val=fn();
			{
				std::lock_guard<std::mutex> lock(mtx_);
				store(key,val,ttl_);
				flight_.erase(key);
			}
			prom->set_value(val);
			return val;
		}catch(...){
			{
				std::lock_guard<std::mutex> lock(mtx_);
				flight_.erase(key);
			}
			prom->set_exception(std::current_exception());
			throw;
		}
	}

	bool erase(const std::string&key){
		std::lock_guard<std::mutex> lock(mtx_);
		auto it=map_.find(key);
		if(it==map_.end()){
			return false;
		}
		lru_.erase(it->second.pos);
		map_.erase(it);
		return true;
	}

	void clear(){
		std::lock_guard<std::mutex> lock(mtx_);
		map_.clear();
		lru_.clear();
	}

	std::size_t size() const{
		std::lock_guard<std::mutex> lock(mtx_);
		return map_.size();
	}

	CacheStats stats() const{
		std::lock_guard<std::mutex> lock(mtx_);
		CacheStats s=st_;
		s.size=map_.size();
		s.capacity=cap_;
		return s;
	}

private:
	struct Entry{
		V val;
		double exp;
		std::list<std::string>::iterator pos;
	};

	bool lookup(const std::string&key,V&out){
		auto it=map_.find(key);
		if(it==map_.end()){
			return false;
		}
		if(it->second.exp>0.0&&clk_()>=it->second.exp){
			lru_.erase(it->second.pos);
			map_.erase(it);
			++st_.expirations;
			return false;
		}
		lru_.splice(lru_.begin(),lru_,it->second.pos);
		out=it->second.val;
		return true;
	}

	void store(const std::string&key,V val,double ttl_s){
		double exp=ttl_s>0.0?clk_()+ttl_s:0.0;
		auto it=map_.find(key);
		if(it!=map_.end()){
			it->second.val=std::move(val);
			it->second.exp=exp;
			lru_.splice(lru_.begin(),lru_,it->second.pos);
			return;
		}
		while(map_.size()>=cap_&&!lru_.empty()){
			map_.erase(lru_.back());
			lru_.pop_back();
			++st_.evictions;
		}
		lru_.push_front(key);
		map_.emplace(key,Entry{std::move(val),exp,lru_.begin()});
	}

	std::size_t cap_;
	double ttl_;
	Clock clk_;
	mutable std::mutex mtx_;
	std::list<std::string> lru_;
	std::unordered_map<std::string,Entry> map_;
	std::unordered_map<std::string,std::shared_future<V>> flight_;
	CacheStats st_;
};
