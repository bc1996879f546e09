#pragma once

#include <list>
#include <mutex>
#include <cstddef>
#include <utility>
#include <optional>
#include <unordered_map>

namespace dgrep {

namespace regex {

namespace impl {

using std::list;
using std::pair;
using std::size_t;
using std::optional;
using std::unordered_map;

// bounded least-recently-used map, safe to share among threads
template <typename KeyT, typename ValueT, typename HashT = std::hash<KeyT>>
struct lru_cache {

	using key_t = KeyT;
	using value_t = ValueT;

	explicit lru_cache(size_t capacity) noexcept: max_size{capacity} {}

	lru_cache(const lru_cache&) = delete;
	lru_cache& operator=(const lru_cache&) = delete;

	// a hit moves the entry to the front
	optional<value_t> get(const key_t& key) {
		std::lock_guard lock{mutex};
		auto it = index.find(key);
		if(it == index.end()) return std::nullopt;
		entries.splice(entries.begin(), entries, it->second);
		return it->second->second;
	}

	// insert unless the key is present, returns the value that ends up cached under the key;
	// with a zero capacity nothing is stored and value is returned as is
	value_t put(const key_t& key, value_t value) {
		std::lock_guard lock{mutex};
		if(max_size == 0) return value;

		if(auto it = index.find(key); it != index.end()) {
			// another thread won the race, keep its entry
			entries.splice(entries.begin(), entries, it->second);
			return it->second->second;
		}

		entries.emplace_front(key, std::move(value));
		index.emplace(key, entries.begin());
		while(entries.size() > max_size) {
			index.erase(entries.back().first);
			entries.pop_back();
		}
		return entries.front().second;
	}

	bool contains(const key_t& key) const{
		std::lock_guard lock{mutex};
		return index.find(key) != index.end();
	}

	size_t size() const{
		std::lock_guard lock{mutex};
		return entries.size();
	}

	size_t capacity() const noexcept{
		return max_size;
	}

	void clear() {
		std::lock_guard lock{mutex};
		index.clear();
		entries.clear();
	}

protected:
	using entry_list_t = list<pair<key_t, value_t>>;

	const size_t max_size;
	// most recently used first
	entry_list_t entries;
	unordered_map<key_t, typename entry_list_t::iterator, HashT> index;
	mutable std::mutex mutex;
};

} // namespace impl

} // namespace regex

} // namespace dgrep
