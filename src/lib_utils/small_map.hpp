#pragma once

#include <vector>
#include <cstddef> // size_t

// Associative container which keeps the insertion order.
// Lookups are linear: meant for JSON objects and short rule lists.
template<typename Key, typename Value>
struct SmallMap {
	struct Pair {
		Key key;
		Value value;
	};

	typedef typename std::vector<Pair>::iterator iterator;
	typedef typename std::vector<Pair>::const_iterator const_iterator;

	// inserts a default value when 'key' is missing
	Value& operator[](Key const& key) {
		auto i = find(key);
		if(i != end())
			return i->value;

		pairs.push_back({key, {}});
		return pairs.back().value;
	}

	iterator find(Key const& key) {
		for(auto i = pairs.begin(); i != pairs.end(); ++i)
			if(i->key == key)
				return i;
		return pairs.end();
	}

	const_iterator find(Key const& key) const {
		for(auto i = pairs.begin(); i != pairs.end(); ++i)
			if(i->key == key)
				return i;
		return pairs.end();
	}

	bool has(Key const& key) const {
		return find(key) != end();
	}

	// later pairs keep their order
	void erase(iterator i) {
		pairs.erase(i);
	}

	iterator begin() {
		return pairs.begin();
	}
	iterator end() {
		return pairs.end();
	}
	const_iterator begin() const {
		return pairs.begin();
	}
	const_iterator end() const {
		return pairs.end();
	}

	size_t size() const {
		return pairs.size();
	}

	std::vector<Pair> pairs;
};
