#include <nebula/value.hpp>
#include <nebula/exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>

using namespace std ;

namespace nebula {

namespace {

bool is_index(const string &key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) { return c >= '0' && c <= '9' ; }) ;
}

bool parse_int64(const string &src, int64_t &val) {
    if ( src.empty() || isspace((unsigned char)src[0]) ) return false ;

    errno = 0 ;
    char *end = nullptr ;
    long long res = strtoll(src.c_str(), &end, 10) ;
    if ( errno == ERANGE || end != src.c_str() + src.length() ) return false ;

    val = res ;
    return true ;
}

bool parse_double(const string &src, double &val) {
    if ( src.empty() || isspace((unsigned char)src[0]) ) return false ;
    // no hexadecimal floats
    if ( src.find_first_of("xX") != string::npos ) return false ;

    char *end = nullptr ;
    double res = strtod(src.c_str(), &end) ;
    if ( end != src.c_str() + src.length() ) return false ;

    val = res ;
    return true ;
}

string to_lower(string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c) ; }) ;
    return s ;
}

// Shortest digits that read back to the same double, written in positional notation
// (no exponent) and without a fraction for integral values, e.g. 3, 0.1, 0.0000001

string format_float(double v) {
    if ( std::isnan(v) ) return "NaN" ;
    if ( std::isinf(v) ) return ( v > 0 ) ? "inf" : "-inf" ;
    if ( v == 0 ) return "0" ;

    char buf[64] ;
    for( int precision = 0 ; precision < 17 ; precision++ ) {
        snprintf(buf, sizeof(buf), "%.*e", precision, v) ;
        if ( strtod(buf, nullptr) == v ) break ;
    }

    // buf is [-]d.ddde[+-]xx
    string mantissa(buf, strchr(buf, 'e')) ;
    int exponent = atoi(strchr(buf, 'e') + 1) ;

    bool negative = mantissa[0] == '-' ;
    string digits ;
    for( char c: mantissa )
        if ( isdigit((unsigned char)c) ) digits += c ;

    while ( digits.length() > 1 && digits.back() == '0' ) digits.pop_back() ;

    // position of the decimal point relative to the first digit
    int point = exponent + 1 ;
    int n = (int)digits.length() ;

    string res = negative ? "-" : "" ;
    if ( point <= 0 )
        res += "0." + string(-point, '0') + digits ;
    else if ( point >= n )
        res += digits + string(point - n, '0') ;
    else
        res += digits.substr(0, point) + '.' + digits.substr(point) ;

    return res ;
}

// quoted json string, control characters as \u escapes

void write_json_string(ostream &strm, const string &str) {
    static const char *hex = "0123456789abcdef" ;

    strm << '"' ;
    for( char c: str ) {
        if ( c == '"' || c == '\\' ) strm << '\\' << c ;
        else if ( c == '\n' ) strm << "\\n" ;
        else if ( c == '\r' ) strm << "\\r" ;
        else if ( c == '\t' ) strm << "\\t" ;
        else if ( c == '\b' ) strm << "\\b" ;
        else if ( c == '\f' ) strm << "\\f" ;
        else if ( (unsigned char)c < 0x20 )
            strm << "\\u00" << hex[( c >> 4 ) & 0xF] << hex[c & 0xF] ;
        else strm << c ;
    }
    strm << '"' ;
}

}

bool Value::isEmpty() const {
    switch ( tag_ ) {
    case Type::Null:
        return true ;
    case Type::String:
        return data_.s_.empty() ;
    case Type::Array:
        return data_.a_.empty() ;
    case Type::Object:
        return data_.o_.empty() ;
    default:
        return false ;
    }
}

bool Value::isTruthy() const {
    switch ( tag_ ) {
    case Type::Null:
        return false ;
    case Type::Boolean:
        return data_.b_ ;
    case Type::Integer:
        return data_.i_ != 0 ;
    case Type::Float:
        return data_.f_ != 0.0 && !std::isnan(data_.f_) ;
    case Type::String:
        return !data_.s_.empty() ;
    case Type::Array:
        return !data_.a_.empty() ;
    case Type::Object:
        return !data_.o_.empty() ;
    }
    return false ;
}

const char *Value::typeName() const {
    switch ( tag_ ) {
    case Type::Null: return "null" ;
    case Type::Boolean: return "boolean" ;
    case Type::Integer: return "integer" ;
    case Type::Float: return "float" ;
    case Type::String: return "string" ;
    case Type::Array: return "array" ;
    case Type::Object: return "object" ;
    }
    return "null" ;
}

// strings "true", "yes", "1", "on" and "false", "no", "0", "off", "" in any case,
// containers by truthiness

bool Value::asBool() const {
    switch ( tag_ ) {
    case Type::Boolean:
        return data_.b_ ;
    case Type::String: {
        string s = to_lower(data_.s_) ;
        if ( s == "true" || s == "yes" || s == "1" || s == "on" ) return true ;
        if ( s == "false" || s == "no" || s == "0" || s == "off" || s.empty() ) return false ;
        throw TypeError(typeName(), "boolean") ;
    }
    default:
        return isTruthy() ;
    }
}

// floats truncate toward zero, strings must hold a base-10 integer

int64_t Value::asInteger() const {
    switch ( tag_ ) {
    case Type::Integer:
        return data_.i_ ;
    case Type::Float: {
        double t = std::trunc(data_.f_) ;
        if ( std::isnan(t) || t < -9223372036854775808.0 || t >= 9223372036854775808.0 )
            throw TypeError(typeName(), "integer") ;
        return static_cast<int64_t>(t) ;
    }
    case Type::Boolean:
        return data_.b_ ? 1 : 0 ;
    case Type::String: {
        int64_t val ;
        if ( !parse_int64(data_.s_, val) ) throw TypeError(typeName(), "integer") ;
        return val ;
    }
    default:
        throw TypeError(typeName(), "integer") ;
    }
}

double Value::asFloat() const {
    switch ( tag_ ) {
    case Type::Float:
        return data_.f_ ;
    case Type::Integer:
        return static_cast<double>(data_.i_) ;
    case Type::Boolean:
        return data_.b_ ? 1.0 : 0.0 ;
    case Type::String: {
        double val ;
        if ( !parse_double(data_.s_, val) ) throw TypeError(typeName(), "float") ;
        return val ;
    }
    default:
        throw TypeError(typeName(), "float") ;
    }
}

string Value::asString() const {
    switch ( tag_ ) {
    case Type::String:
        return data_.s_ ;
    case Type::Null:
        return "null" ;
    case Type::Boolean:
        return data_.b_ ? "true" : "false" ;
    case Type::Integer:
        return std::to_string(data_.i_) ;
    case Type::Float:
        return format_float(data_.f_) ;
    default:
        throw TypeError(typeName(), "string") ;
    }
}

const Value::Array &Value::asArray() const {
    if ( !isArray() ) throw TypeError(typeName(), "array") ;
    return data_.a_ ;
}

const Value::Object &Value::asObject() const {
    if ( !isObject() ) throw TypeError(typeName(), "object") ;
    return data_.o_ ;
}

size_t Value::length() const {
    switch ( tag_ ) {
    case Type::String:
        return data_.s_.length() ;
    case Type::Array:
        return data_.a_.size() ;
    case Type::Object:
        return data_.o_.size() ;
    default:
        throw TypeError(typeName(), "string, array, or object") ;
    }
}

const Value *Value::get(const string &key) const {
    if ( isObject() ) {
        auto it = data_.o_.find(key) ;
        if ( it == data_.o_.end() ) return nullptr ;
        else return &it->second ;
    }
    else if ( isArray() ) {
        if ( !is_index(key) ) return nullptr ;
        errno = 0 ;
        unsigned long long idx = strtoull(key.c_str(), nullptr, 10) ;
        if ( errno == ERANGE || idx >= data_.a_.size() ) return nullptr ;
        return &data_.a_[idx] ;
    }
    return nullptr ;
}

const Value *Value::navigate(const string &path) const {

    if ( path.empty() ) return this ;

    const Value *current = this ;
    size_t start = 0, end = 0;

    while ( end != string::npos ) {
        end = path.find('.', start) ;
        string subkey = path.substr(start, end == string::npos ? string::npos : end - start) ;

        current = current->get(subkey) ;
        if ( current == nullptr ) return nullptr ;

        start = end + 1 ;
    }

    return current ;
}

void Value::set(const string &key, const Value &val) {
    if ( isObject() ) {
        data_.o_[key] = val ;
    }
    else if ( isArray() ) {
        if ( !is_index(key) ) throw TypeError("string", "array index") ;

        errno = 0 ;
        unsigned long long idx = strtoull(key.c_str(), nullptr, 10) ;
        if ( errno == ERANGE || idx > (unsigned long long)std::numeric_limits<int64_t>::max() )
            throw IndexError(std::numeric_limits<int64_t>::max(), data_.a_.size()) ;
        if ( idx >= data_.a_.size() )
            throw IndexError((int64_t)idx, data_.a_.size()) ;

        data_.a_[idx] = val ;
    }
    else
        throw TypeError(typeName(), "object or array") ;
}

bool Value::operator == (const Value &other) const {
    if ( tag_ != other.tag_ ) return false ;

    switch ( tag_ ) {
    case Type::Null:
        return true ;
    case Type::Boolean:
        return data_.b_ == other.data_.b_ ;
    case Type::Integer:
        return data_.i_ == other.data_.i_ ;
    case Type::Float:
        return data_.f_ == other.data_.f_ ;
    case Type::String:
        return data_.s_ == other.data_.s_ ;
    case Type::Array:
        return data_.a_ == other.data_.a_ ;
    case Type::Object:
        return data_.o_ == other.data_.o_ ;
    }
    return false ;
}

void Value::toJSON(ostream &strm) const {

    switch ( tag_ ) {
    case Type::Object: {
        const char *sep = "" ;
        strm << '{' ;
        for( const auto &kv: data_.o_ ) {
            strm << sep ;
            write_json_string(strm, kv.first) ;
            strm << ':' ;
            kv.second.toJSON(strm) ;
            sep = "," ;
        }
        strm << '}' ;
        break ;
    }
    case Type::Array: {
        const char *sep = "" ;
        strm << '[' ;
        for( const Value &e: data_.a_ ) {
            strm << sep ;
            e.toJSON(strm) ;
            sep = "," ;
        }
        strm << ']' ;
        break ;
    }
    case Type::String:
        write_json_string(strm, data_.s_) ;
        break ;
    case Type::Boolean:
        strm << ( data_.b_ ? "true" : "false" ) ;
        break ;
    case Type::Null:
        strm << "null" ;
        break ;
    case Type::Float: {
        // JSON has no representation for NaN and infinities
        if ( std::isfinite(data_.f_) ) {
            // keep a fraction so that the value decodes back as a float
            string text = format_float(data_.f_) ;
            if ( text.find('.') == string::npos ) text += ".0" ;
            strm << text ;
        }
        else strm << "null" ;
        break ;
    }
    case Type::Integer:
        strm << data_.i_ ;
        break ;
    }
}

string Value::toJSON() const {
    ostringstream strm ;
    toJSON(strm) ;
    return strm.str() ;
}

ostream &operator << (ostream &strm, const Value &v) {
    if ( v.isString() ) strm << v.asString() ;
    else v.toJSON(strm) ;
    return strm ;
}

}
