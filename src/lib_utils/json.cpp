// Simplistic standalone JSON-parser

#include "json.hpp"
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace json {
namespace {

struct Token {
	enum Type {
		EOF_ = 0,
		LBRACE,
		RBRACE,
		LBRACKET,
		RBRACKET,
		STRING,
		NUMBER,
		BOOLEAN,
		NULL_,
		COLON,
		COMMA,
	};

	std::string lexem;
	Type type;
};

void appendUtf8(std::string& s, uint32_t cp) {
	if(cp < 0x80) {
		s += (char)cp;
	} else if(cp < 0x800) {
		s += (char)(0xC0 | (cp >> 6));
		s += (char)(0x80 | (cp & 0x3F));
	} else if(cp < 0x10000) {
		s += (char)(0xE0 | (cp >> 12));
		s += (char)(0x80 | ((cp >> 6) & 0x3F));
		s += (char)(0x80 | (cp & 0x3F));
	} else {
		s += (char)(0xF0 | (cp >> 18));
		s += (char)(0x80 | ((cp >> 12) & 0x3F));
		s += (char)(0x80 | ((cp >> 6) & 0x3F));
		s += (char)(0x80 | (cp & 0x3F));
	}
}

class Tokenizer {
	public:
		Tokenizer(const char* text_, size_t len) {
			text = text_;
			textEnd = text_ + len;
			decodeToken();
		}

		const Token& front() const {
			return curr;
		}
		bool empty() const {
			return curr.type == Token::EOF_;
		}
		void popFront() {
			decodeToken();
		}

	private:
		void decodeToken() {
			while(whitespace(frontChar()))
				++text;

			curr.lexem = "";
			switch(frontChar()) {
			case '\0':
				curr.type = Token::EOF_;
				break;
			case '[':
				accept();
				curr.type = Token::LBRACKET;
				break;
			case ']':
				accept();
				curr.type = Token::RBRACKET;
				break;
			case '{':
				accept();
				curr.type = Token::LBRACE;
				break;
			case '}':
				accept();
				curr.type = Token::RBRACE;
				break;
			case ':':
				accept();
				curr.type = Token::COLON;
				break;
			case ',':
				accept();
				curr.type = Token::COMMA;
				break;
			case '"':
				++text;
				decodeString();
				curr.type = Token::STRING;
				break;
			case 't':
				curr.type = Token::BOOLEAN;
				expect('t');
				expect('r');
				expect('u');
				expect('e');
				break;
			case 'f':
				curr.type = Token::BOOLEAN;
				expect('f');
				expect('a');
				expect('l');
				expect('s');
				expect('e');
				break;
			case 'n':
				curr.type = Token::NULL_;
				expect('n');
				expect('u');
				expect('l');
				expect('l');
				break;
			case '-': case '0': case '1': case '2':
			case '3': case '4': case '5': case '6':
			case '7': case '8': case '9': {
				curr.type = Token::NUMBER;

				if(frontChar() == '-')
					accept();

				if(!isdigit(frontChar()))
					throw std::runtime_error("Invalid number");

				while(isdigit(frontChar()))
					accept();

				if(frontChar() == '.') {
					accept();
					if(!isdigit(frontChar()))
						throw std::runtime_error("Invalid number");
					while(isdigit(frontChar()))
						accept();
				}

				if(frontChar() == 'e' || frontChar() == 'E') {
					accept();
					if(frontChar() == '+' || frontChar() == '-')
						accept();
					if(!isdigit(frontChar()))
						throw std::runtime_error("Invalid number");
					while(isdigit(frontChar()))
						accept();
				}

				break;
			}
			default: {
				std::string msg = "Unknown char '";
				msg += frontChar();
				msg += "'";
				throw std::runtime_error(msg);
			}
			}
		}

		// the opening quote was already consumed
		void decodeString() {
			while(true) {
				if(text >= textEnd)
					throw std::runtime_error("Unterminated string");

				auto const c = *text++;
				if(c == '"')
					return;

				if(c != '\\') {
					curr.lexem += c;
					continue;
				}

				if(text >= textEnd)
					throw std::runtime_error("Unterminated string");

				auto const esc = *text++;
				switch(esc) {
				case '"': curr.lexem += '"'; break;
				case '\\': curr.lexem += '\\'; break;
				case '/': curr.lexem += '/'; break;
				case 'b': curr.lexem += '\b'; break;
				case 'f': curr.lexem += '\f'; break;
				case 'n': curr.lexem += '\n'; break;
				case 'r': curr.lexem += '\r'; break;
				case 't': curr.lexem += '\t'; break;
				case 'u': {
					uint32_t cp = decodeHex4();
					if(cp >= 0xD800 && cp <= 0xDBFF) {
						// surrogate pair
						if(textEnd - text < 6 || text[0] != '\\' || text[1] != 'u')
							throw std::runtime_error("Invalid surrogate pair");
						text += 2;
						auto const low = decodeHex4();
						if(low < 0xDC00 || low > 0xDFFF)
							throw std::runtime_error("Invalid surrogate pair");
						cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
					}
					appendUtf8(curr.lexem, cp);
					break;
				}
				default:
					throw std::runtime_error(std::string("Invalid escape sequence '\\") + esc + "'");
				}
			}
		}

		uint32_t decodeHex4() {
			if(textEnd - text < 4)
				throw std::runtime_error("Truncated unicode escape");
			uint32_t r = 0;
			for(int i = 0; i < 4; ++i) {
				auto const c = *text++;
				r <<= 4;
				if(c >= '0' && c <= '9')
					r |= c - '0';
				else if(c >= 'a' && c <= 'f')
					r |= c - 'a' + 10;
				else if(c >= 'A' && c <= 'F')
					r |= c - 'A' + 10;
				else
					throw std::runtime_error("Invalid unicode escape");
			}
			return r;
		}

		void expect(char c) {
			if(frontChar() != c)
				throw std::runtime_error("Unexpected character");

			accept();
		}

		void accept() {
			curr.lexem += frontChar();
			++text;
		}

		char frontChar() const {
			if(text >= textEnd)
				return 0;

			return *text;
		}

		static bool isdigit(char c) {
			return c >= '0' && c <= '9';
		}

		static bool whitespace(char c) {
			return c == ' ' || c == '\n' || c == '\r' || c == '\t';
		}

		const char* text;
		const char* textEnd;
		Token curr;
};

using namespace json;

std::string expect(Tokenizer& tk, Token::Type type) {
	auto front = tk.front();

	if(front.type != type) {
		std::string msg;

		if(front.type == Token::EOF_)
			msg += "Unexpected end of file found";
		else {
			msg += "Unexpected token '" + front.lexem + "'";
			msg += " of type " + std::to_string(front.type);
			msg += " instead of " + std::to_string(type);
		}

		throw std::runtime_error(msg);
	}

	auto r = front.lexem;
	tk.popFront();
	return r;
}

Value parseValue(Tokenizer& tk);

Value parseObject(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Object;
	expect(tk, Token::LBRACE);
	int idx = 0;

	while(tk.front().type != Token::RBRACE) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		auto const name = expect(tk, Token::STRING);
		expect(tk, Token::COLON);
		r.objectValue[name] = parseValue(tk);
		++idx;
	}

	expect(tk, Token::RBRACE);
	return r;
}

Value parseArray(Tokenizer& tk) {
	Value r;
	r.type = Value::Type::Array;
	expect(tk, Token::LBRACKET);
	int idx = 0;

	while(tk.front().type != Token::RBRACKET) {
		if(idx > 0)
			expect(tk, Token::COMMA);

		r.arrayValue.push_back(parseValue(tk));
		++idx;
	}

	expect(tk, Token::RBRACKET);
	return r;
}

bool isIntegerLexem(std::string const& s) {
	if(s.find_first_of(".eE") != std::string::npos)
		return false;
	auto const n = strtoll(s.c_str(), nullptr, 10);
	return n >= INT_MIN && n <= INT_MAX;
}

Value parseValue(Tokenizer& tk) {
	if(tk.front().type == Token::LBRACKET) {
		return parseArray(tk);
	} else if(tk.front().type == Token::LBRACE) {
		return parseObject(tk);
	} else if(tk.front().type == Token::BOOLEAN) {
		Value r;
		r.type = Value::Type::Boolean;
		r.boolValue = expect(tk, Token::BOOLEAN) == "true";
		return r;
	} else if(tk.front().type == Token::NULL_) {
		expect(tk, Token::NULL_);
		return Value();
	} else if(tk.front().type == Token::NUMBER) {
		auto const lexem = expect(tk, Token::NUMBER);
		Value r;
		if(isIntegerLexem(lexem)) {
			r.type = Value::Type::Integer;
			r.intValue = atoi(lexem.c_str());
		} else {
			r.type = Value::Type::Float;
			r.floatValue = strtod(lexem.c_str(), nullptr);
		}
		return r;
	} else {
		Value r;
		r.type = Value::Type::String;
		r.stringValue = expect(tk, Token::STRING);
		return r;
	}
}

void serializeString(std::string& out, std::string const& s) {
	out += '"';
	for(auto c : s) {
		switch(c) {
		case '"': out += "\\\""; break;
		case '\\': out += "\\\\"; break;
		case '\n': out += "\\n"; break;
		case '\r': out += "\\r"; break;
		case '\t': out += "\\t"; break;
		case '\b': out += "\\b"; break;
		case '\f': out += "\\f"; break;
		default:
			if((unsigned char)c < 0x20) {
				char buffer[8];
				snprintf(buffer, sizeof buffer, "\\u%04x", (unsigned)c);
				out += buffer;
			} else {
				out += c;
			}
		}
	}
	out += '"';
}

void serializeValue(std::string& out, Value const& v) {
	switch(v.type) {
	case Value::Type::Null:
		out += "null";
		break;
	case Value::Type::String:
		serializeString(out, v.stringValue);
		break;
	case Value::Type::Boolean:
		out += v.boolValue ? "true" : "false";
		break;
	case Value::Type::Integer:
		out += std::to_string(v.intValue);
		break;
	case Value::Type::Float: {
		if(!std::isfinite(v.floatValue))
			throw std::runtime_error("Can't serialize a non-finite number");
		char buffer[64];
		snprintf(buffer, sizeof buffer, "%.17g", v.floatValue);
		out += buffer;
		break;
	}
	case Value::Type::Array: {
		out += '[';
		bool first = true;
		for(auto& item : v.arrayValue) {
			if(!first)
				out += ", ";
			serializeValue(out, item);
			first = false;
		}
		out += ']';
		break;
	}
	case Value::Type::Object: {
		out += '{';
		bool first = true;
		for(auto& pair : v.objectValue) {
			if(!first)
				out += ", ";
			serializeString(out, pair.key);
			out += ": ";
			serializeValue(out, pair.value);
			first = false;
		}
		out += '}';
		break;
	}
	}
}
} /*anonymous*/

void Value::enforceType(Type expected) const {
	if(type != expected)
		throw std::runtime_error("Type error");
}

Value const& Value::operator[] (const char* name) const {
	enforceType(Type::Object);
	auto it = objectValue.find(name);
	if(it == objectValue.end())
		throw std::runtime_error("Member '" + std::string(name) + "' was not found");

	return (*it).value;
}

bool Value::has(const char* name) const {
	enforceType(Type::Object);
	return objectValue.find(name) != objectValue.end();
}

double Value::numberValue() const {
	if(type == Type::Integer)
		return intValue;
	enforceType(Type::Float);
	return floatValue;
}

Value makeString(std::string s) {
	Value r;
	r.type = Value::Type::String;
	r.stringValue = std::move(s);
	return r;
}

Value makeArray(std::vector<Value> values) {
	Value r;
	r.type = Value::Type::Array;
	r.arrayValue = std::move(values);
	return r;
}

Value parse(const std::string &s) {
	Tokenizer tokenizer(s.c_str(), s.size());
	auto r = parseObject(tokenizer);
	if(!tokenizer.empty())
		throw std::runtime_error("Trailing characters after JSON document");
	return r;
}

std::string serialize(Value const& v) {
	std::string r;
	serializeValue(r, v);
	return r;
}
}
