#pragma once

#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

namespace json {

struct Value {
		enum class Type {
			Null,
			String,
			Object,
			Array,
			Integer,
			Float,
			Boolean,
		};

		Type type = Type::Null;

		////////////////////////////////////////
		// type == Type::String
		std::string stringValue;

		////////////////////////////////////////
		// type == Type::Object
		SmallMap<std::string, Value> objectValue;

		Value const& operator[] (const char* name) const;
		bool has(const char* name) const;

		////////////////////////////////////////
		// type == Type::Array
		std::vector<Value> arrayValue;

		Value const& operator[] (int i) {
			enforceType(Type::Array);
			return arrayValue[i];
		}

		////////////////////////////////////////
		// type == Type::Boolean
		bool boolValue {};

		////////////////////////////////////////
		// type == Type::Integer
		int intValue {};

		////////////////////////////////////////
		// type == Type::Float
		double floatValue {};

		// accepts both Integer and Float
		double numberValue() const;

		bool isNull() const {
			return type == Type::Null;
		}
		bool isNumber() const {
			return type == Type::Integer || type == Type::Float;
		}

	private:
		void enforceType(Type expected) const;
};

Value makeString(std::string s);
Value makeArray(std::vector<Value> values);

// parses a document whose root is an object
Value parse(const std::string &s);

std::string serialize(Value const& v);
}
