#pragma once

#include <cstdint>
#include <cstddef> // size_t
#include <string>

template<typename T>
struct span {
	T* ptr;
	size_t len;

	span() = default;

	span(T* ptr_, size_t len_) : ptr(ptr_), len(len_) {
	}

	T* begin() const {
		return ptr;
	}

	T* end() const {
		return ptr + len;
	}
};

using Span = span<uint8_t>;
using SpanC = span<const uint8_t>;

inline std::string toString(SpanC buf) {
	return std::string((const char*)buf.ptr, buf.len);
}
