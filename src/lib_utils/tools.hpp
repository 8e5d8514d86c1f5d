#pragma once

#include <memory>
#include <stdexcept> //runtime_error
#include <string>
#include <vector>

inline
void enforce(bool condition, const char* msg) {
	if (!condition)
		throw std::runtime_error(msg);
}

inline
bool startsWith(std::string const& s, std::string const& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}

inline
bool endsWith(std::string const& s, std::string const& suffix) {
	return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ASCII only
inline
std::string toLower(std::string s) {
	for(auto& c : s)
		if(c >= 'A' && c <= 'Z')
			c = c - 'A' + 'a';
	return s;
}

// ASCII only
inline
std::string toUpper(std::string s) {
	for(auto& c : s)
		if(c >= 'a' && c <= 'z')
			c = c - 'a' + 'A';
	return s;
}

inline
bool isSpace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline
std::string trim(std::string const& s) {
	size_t first = 0;
	while(first < s.size() && isSpace(s[first]))
		++first;
	size_t last = s.size();
	while(last > first && isSpace(s[last - 1]))
		--last;
	return s.substr(first, last - first);
}

// splits on runs of whitespace, never returns empty tokens
inline
std::vector<std::string> splitWords(std::string const& s) {
	std::vector<std::string> r;
	std::string curr;
	for(auto c : s) {
		if(isSpace(c)) {
			if(!curr.empty())
				r.push_back(curr);
			curr.clear();
		} else {
			curr += c;
		}
	}
	if(!curr.empty())
		r.push_back(curr);
	return r;
}

inline
std::vector<std::string> split(std::string const& s, char sep) {
	std::vector<std::string> r;
	size_t start = 0;
	while(true) {
		auto const pos = s.find(sep, start);
		if(pos == std::string::npos) {
			r.push_back(s.substr(start));
			return r;
		}
		r.push_back(s.substr(start, pos - start));
		start = pos + 1;
	}
}

inline
std::string join(std::vector<std::string> const& parts, std::string const& sep) {
	std::string r;
	for(size_t i = 0; i < parts.size(); ++i) {
		if(i > 0)
			r += sep;
		r += parts[i];
	}
	return r;
}
