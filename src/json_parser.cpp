// json decoder used for context documents and the Value::fromJSON* helpers

#include <nebula/value.hpp>
#include <nebula/exceptions.hpp>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

using namespace std ;

namespace nebula {
namespace detail {

class JSONParser {
public:
    JSONParser(const string &src): src_(src), pos_(0) {}

    // the whole input must be a single json value, surrounded by optional whitespace
    Value parse() ;

private:

    Value parseValue() ;
    Value parseString() ;
    Value parseNumber() ;
    Value parseArray() ;
    Value parseObject() ;
    Value parseKeyword(const char *word, const Value &val) ;

    string parseStringLiteral() ;
    unsigned int parseHexQuad() ;
    static void appendUTF8(string &res, unsigned int cp) ;

    void skipSpace() ;
    bool atEnd() const { return pos_ >= src_.length() ; }
    char current() const { return src_[pos_] ; }
    bool consume(char c) ;
    void expect(char c, const char *what) ;

    [[noreturn]] void throwException(const std::string &msg) ;

    const string &src_ ;
    size_t pos_ ;
};

Value JSONParser::parse() {
    Value value = parseValue() ;

    skipSpace() ;
    if ( !atEnd() )
        throwException("Unexpected trailing characters") ;

    return value ;
}

Value JSONParser::parseValue() {
    skipSpace() ;

    if ( atEnd() ) throwException("Unexpected end of input") ;

    switch ( current() ) {
    case '"': return parseString() ;
    case '[': return parseArray() ;
    case '{': return parseObject() ;
    case 't': return parseKeyword("true", Value(true)) ;
    case 'f': return parseKeyword("false", Value(false)) ;
    case 'n': return parseKeyword("null", Value()) ;
    default:
        if ( current() == '-' || isdigit((unsigned char)current()) )
            return parseNumber() ;
        throwException(string("Unexpected character '") + current() + "'") ;
    }
}

Value JSONParser::parseString() {
    return Value(parseStringLiteral()) ;
}

string JSONParser::parseStringLiteral() {
    expect('"', "'\"'") ;

    string res ;

    while ( !atEnd() ) {
        char c = src_[pos_++] ;

        if ( c == '"' ) return res ;
        else if ( c != '\\' ) {
            res += c ;
            continue ;
        }

        if ( atEnd() ) break ;

        char escape = src_[pos_++] ;
        switch ( escape ) {
        case '"': res += '"' ; break ;
        case '/': res += '/' ; break ;
        case '\\': res += '\\' ; break ;
        case 'b': res += '\b' ; break ;
        case 'f': res += '\f' ; break ;
        case 'n': res += '\n' ; break ;
        case 'r': res += '\r' ; break ;
        case 't': res += '\t' ; break ;
        case 'u': {
            unsigned int cp = parseHexQuad() ;
            // surrogate pair
            if ( cp >= 0xD800 && cp <= 0xDBFF && src_.compare(pos_, 2, "\\u") == 0 ) {
                pos_ += 2 ;
                unsigned int low = parseHexQuad() ;
                if ( low < 0xDC00 || low > 0xDFFF )
                    throwException("Invalid unicode surrogate pair") ;
                cp = 0x10000 + ( ( cp - 0xD800 ) << 10 ) + ( low - 0xDC00 ) ;
            }
            appendUTF8(res, cp) ;
            break ;
        }
        default:
            throwException("Invalid escape sequence in string literal") ;
        }
    }

    throwException("End of input while parsing string literal") ;
}

unsigned int JSONParser::parseHexQuad() {
    unsigned int cp = 0 ;

    for( int i = 0 ; i < 4 ; i++ ) {
        if ( atEnd() || !isxdigit((unsigned char)current()) )
            throwException("Invalid unicode escape") ;

        char c = src_[pos_++] ;
        cp <<= 4 ;
        if ( c <= '9' ) cp |= c - '0' ;
        else cp |= ( tolower((unsigned char)c) - 'a' ) + 10 ;
    }

    return cp ;
}

void JSONParser::appendUTF8(string &res, unsigned int cp) {
    if ( cp < 0x80 )
        res += (char)cp ;
    else if ( cp < 0x800 ) {
        res += (char)( 0xC0 | ( cp >> 6 ) ) ;
        res += (char)( 0x80 | ( cp & 0x3F ) ) ;
    }
    else if ( cp < 0x10000 ) {
        res += (char)( 0xE0 | ( cp >> 12 ) ) ;
        res += (char)( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) ;
        res += (char)( 0x80 | ( cp & 0x3F ) ) ;
    }
    else {
        res += (char)( 0xF0 | ( cp >> 18 ) ) ;
        res += (char)( 0x80 | ( ( cp >> 12 ) & 0x3F ) ) ;
        res += (char)( 0x80 | ( ( cp >> 6 ) & 0x3F ) ) ;
        res += (char)( 0x80 | ( cp & 0x3F ) ) ;
    }
}

// -?(0|[1-9][0-9]*)(.[0-9]+)?([eE][+-]?[0-9]+)?
// integers that fit in 64 bits are kept as integers, everything else becomes a float

Value JSONParser::parseNumber() {
    size_t start = pos_ ;
    bool is_float = false ;

    auto digits = [&]() -> size_t {
        size_t n = 0 ;
        while ( !atEnd() && isdigit((unsigned char)current()) ) { ++pos_ ; ++n ; }
        return n ;
    } ;

    consume('-') ;

    if ( consume('0') ) {
        if ( !atEnd() && isdigit((unsigned char)current()) )
            throwException("Leading zeros are not allowed") ;
    }
    else if ( digits() == 0 )
        throwException("Invalid number") ;

    if ( consume('.') ) {
        is_float = true ;
        if ( digits() == 0 ) throwException("Expected digits after decimal point") ;
    }

    if ( !atEnd() && ( current() == 'e' || current() == 'E' ) ) {
        ++pos_ ;
        is_float = true ;
        if ( !consume('+') ) consume('-') ;
        if ( digits() == 0 ) throwException("Expected exponent digits") ;
    }

    string text = src_.substr(start, pos_ - start) ;

    if ( !is_float ) {
        errno = 0 ;
        long long number = strtoll(text.c_str(), nullptr, 10) ;
        if ( errno != ERANGE )
            return Value((int64_t)number) ;
    }

    return Value(strtod(text.c_str(), nullptr)) ;
}

Value JSONParser::parseArray() {
    expect('[', "'['") ;

    Value::Array elements ;

    skipSpace() ;
    if ( consume(']') ) return elements ;

    while ( 1 ) {
        elements.emplace_back(parseValue()) ;

        skipSpace() ;
        if ( consume(']') ) return elements ;
        expect(',', "',' or ']'") ;
    }
}

Value JSONParser::parseObject() {
    expect('{', "'{'") ;

    Value::Object members ;

    skipSpace() ;
    if ( consume('}') ) return members ;

    while ( 1 ) {
        skipSpace() ;
        if ( atEnd() || current() != '"' )
            throwException("Expected member name") ;

        string key = parseStringLiteral() ;

        skipSpace() ;
        expect(':', "':'") ;

        members[key] = parseValue() ;

        skipSpace() ;
        if ( consume('}') ) return members ;
        expect(',', "',' or '}'") ;
    }
}

Value JSONParser::parseKeyword(const char *word, const Value &val) {
    size_t len = strlen(word) ;
    if ( src_.compare(pos_, len, word) != 0 )
        throwException(string("Invalid literal, expected '") + word + "'") ;
    pos_ += len ;
    return val ;
}

void JSONParser::skipSpace() {
    while ( !atEnd() && isspace((unsigned char)current()) ) ++pos_ ;
}

bool JSONParser::consume(char c) {
    if ( atEnd() || current() != c ) return false ;
    ++pos_ ;
    return true ;
}

void JSONParser::expect(char c, const char *what) {
    if ( !consume(c) ) throwException(string("Expected ") + what) ;
}

void JSONParser::throwException(const string &msg) {
    ostringstream strm ;
    strm << msg << " at offset " << pos_ ;
    throw JsonError(strm.str()) ;
}

}

Value Value::fromJSONString(const std::string &src) {
    detail::JSONParser parser(src) ;
    return parser.parse() ;
}

Value Value::fromJSONFile(const string &path) {
    ifstream strm(path) ;
    if ( !strm )
        throw IoError("Cannot open file: " + path) ;

    ostringstream buf ;
    buf << strm.rdbuf() ;
    return fromJSONString(buf.str()) ;
}

}
