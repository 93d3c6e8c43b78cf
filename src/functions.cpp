#include <nebula/functions.hpp>
#include <nebula/exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

using namespace std ;

namespace nebula {

const Function *FunctionRegistry::lookup(const string &name) const
{
    auto it = functions_.find(name) ;
    if ( it == functions_.end() ) return nullptr ;
    return &it->second ;
}

Value FunctionRegistry::invoke(const string &name, const Value::Array &args) const
{
    const Function *f = lookup(name) ;
    if ( f == nullptr )
        throw FunctionError(name, "Function not found") ;

    return call_function(name, *f, args) ;
}

void FunctionRegistry::registerFunction(const string &name, const Function &f) {
    functions_[name] = f ;
}

bool FunctionRegistry::hasFunction(const string &name) const
{
    return functions_.count(name) ;
}

vector<string> FunctionRegistry::names() const {
    vector<string> res ;
    for( const auto &kv: functions_ )
        res.push_back(kv.first) ;
    return res ;
}

Value call_function(const string &name, const Function &f, const Value::Array &args) {
    try {
        return f(args) ;
    }
    catch ( TemplateException & ) {
        throw ;
    }
    catch ( std::exception &e ) {
        vector<string> sargs ;
        for( const Value &a: args )
            sargs.push_back(a.toJSON()) ;
        throw FunctionError(name, e.what(), sargs) ;
    }
}

void unpack_args(const string &function, const Value::Array &args, const std::vector<std::string> &named_args, Value::Array &res) {

    size_t n_args = named_args.size() ;

    if ( args.size() > n_args )
        throw SignatureError(function, "expected at most " + std::to_string(n_args) + " arguments, got " + std::to_string(args.size())) ;

    res.assign(n_args, Value::null()) ;

    for ( size_t pos = 0 ; pos < n_args ; pos ++ )  {
        const string &named_arg = named_args[pos] ;
        bool optional = named_arg.back() == '?' ;

        if ( pos < args.size() )
            res[pos] = args[pos] ;
        else if ( !optional )
            throw SignatureError(function, "missing required argument '" + named_arg + "'") ;
    }
}

static string map_chars(string s, int (*fn)(int)) {
    std::transform(s.begin(), s.end(), s.begin(), [fn](unsigned char c) { return (char)fn(c) ; }) ;
    return s ;
}

static Value _upper(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("upper", args, { "str" }, unpacked) ;
    return map_chars(unpacked[0].asString(), ::toupper) ;
}

static Value _lower(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("lower", args, { "str" }, unpacked) ;
    return map_chars(unpacked[0].asString(), ::tolower) ;
}

static Value _trim(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("trim", args, { "str" }, unpacked) ;

    string s = unpacked[0].asString() ;
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0 ; } ;
    auto b = std::find_if_not(s.begin(), s.end(), is_space) ;
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base() ;
    return ( b < e ) ? string(b, e) : string() ;
}

static Value _join(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("join", args, { "string_list", "sep?", "key?" },  unpacked) ;

    string sep = ( unpacked[1].isNull() ) ? "" : unpacked[1].asString() ;
    string key = ( unpacked[2].isNull() ) ? "" : unpacked[2].asString() ;

    bool is_first = true ;
    string res ;
    for( auto &i: unpacked[0].asArray() ) {
        if ( !is_first ) res.append(sep) ;
        if ( !key.empty() ) {
            const Value *member = i.navigate(key) ;
            if ( member == nullptr )
                throw FunctionError("join", "element has no member '" + key + "'") ;
            res.append(member->asString()) ;
        }
        else
            res.append(i.asString()) ;
        is_first = false ;
    }
    return res ;
}

static Value _default(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("default", args, { "value", "default" }, unpacked) ;
    return unpacked[0].isEmpty() ? unpacked[1] : unpacked[0] ;
}

static const uint64_t max_range_elements = 1000000 ;

static Value _range(const Value::Array &args) {
    Value::Array unpacked, result ;
    unpack_args("range", args, { "start", "end", "step?" }, unpacked) ;

    int64_t start = unpacked[0].asInteger() ;
    int64_t stop = unpacked[1].asInteger() ;
    int64_t step = unpacked[2].isNull() ? 1 : unpacked[2].asInteger() ;
    if ( step == 0 ) throw FunctionError("range", "Zero step is provided in range function") ;
    if ( ( step > 0 && start > stop ) ||
         ( step < 0 && start < stop ) )
        throw FunctionError("range", "Invalid arguments provided in range function") ;

    // element count, computed unsigned so that the full int64 span fits
    uint64_t span = ( step > 0 ) ? (uint64_t)stop - (uint64_t)start : (uint64_t)start - (uint64_t)stop ;
    uint64_t stride = ( step > 0 ) ? (uint64_t)step : (uint64_t)0 - (uint64_t)step ;
    uint64_t count = span / stride + 1 ;

    if ( count > max_range_elements )
        throw FunctionError("range", "Range function would produce too many elements") ;

    result.reserve(count) ;

    int64_t i = start ;
    for( uint64_t k = 0 ; k < count ; k++ ) {
        result.push_back(i) ;
        if ( k + 1 < count ) i += step ;
    }

    return result ;
}

static Value _length(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("length", args, { "value" }, unpacked) ;

    return (int64_t)unpacked[0].length() ;
}

// first and last work on utf-8 code points, not bytes
static bool is_continuation_byte(char c) {
    return ( (unsigned char)c & 0xC0 ) == 0x80 ;
}

static Value _last(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("last", args, { "value" }, unpacked) ;

    const Value &v = unpacked[0] ;
    if ( v.isArray() && !v.isEmpty() )
        return v.asArray().back() ;
    else if ( v.isString() && !v.isEmpty() ) {
        const string &s = v.asString() ;
        size_t pos = s.length() - 1 ;
        while ( pos > 0 && is_continuation_byte(s[pos]) ) --pos ;
        return s.substr(pos) ;
    }
    else return Value::null() ;
}

static Value _first(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("first", args, { "value" }, unpacked) ;

    const Value &v = unpacked[0] ;
    if ( v.isArray() && !v.isEmpty() )
        return v.asArray().front() ;
    else if ( v.isString() && !v.isEmpty() ) {
        const string &s = v.asString() ;
        size_t len = 1 ;
        while ( len < s.length() && is_continuation_byte(s[len]) ) ++len ;
        return s.substr(0, len) ;
    }
    else return Value::null() ;
}

static Value _merge(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("merge", args, { "src", "other" }, unpacked) ;

    if ( unpacked[0].isArray() ) {
        Value::Array res(unpacked[0].asArray()) ;

        for( auto &e: unpacked[1].asArray() )
            res.push_back(e) ;

        return res ;
    } else if ( unpacked[0].isObject() ) {
        Value::Object res(unpacked[0].asObject()) ;

        for( auto &kv: unpacked[1].asObject() )
            res[kv.first] = kv.second ;

        return res ;
    }

    throw TypeError(unpacked[0].typeName(), "array or object", "merge") ;
}

static Value _round(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("round", args, { "number", "digits?" }, unpacked) ;

    double x = unpacked[0].asFloat() ;
    int64_t digits = unpacked[1].isNull() ? 0 : unpacked[1].asInteger() ;

    if ( digits < 0 || digits > 15 )
        throw FunctionError("round", "digits must be between 0 and 15") ;

    double scale = std::pow(10.0, (double)digits) ;
    return std::round(x * scale) / scale ;
}

static Value _json(const Value::Array &args) {
    Value::Array unpacked ;
    unpack_args("json", args, { "value" }, unpacked) ;
    return unpacked[0].toJSON() ;
}

FunctionRegistry FunctionRegistry::withBuiltins() {
    FunctionRegistry r ;
    r.registerFunction("uppercase", _upper);
    r.registerFunction("upper", _upper);
    r.registerFunction("lowercase", _lower);
    r.registerFunction("lower", _lower);
    r.registerFunction("trim", _trim);
    r.registerFunction("join", _join);
    r.registerFunction("default", _default);
    r.registerFunction("range", _range);
    r.registerFunction("length", _length);
    r.registerFunction("first", _first);
    r.registerFunction("last", _last);
    r.registerFunction("merge", _merge);
    r.registerFunction("round", _round);
    r.registerFunction("json", _json);
    return r ;
}

}
