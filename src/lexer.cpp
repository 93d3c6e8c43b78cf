#include "lexer.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

using namespace std ;

namespace nebula {
namespace detail {

static bool is_name_start(char c) {
    return isalpha((unsigned char)c) || c == '_' ;
}

static bool is_name_char(char c) {
    return isalnum((unsigned char)c) || c == '_' ;
}

static bool is_segment_char(char c) {
    return is_name_char(c) || c == '-' ;
}

const Token &Lexer::peek() {
    if ( !has_lookahead_ ) {
        lookahead_ = scan() ;
        has_lookahead_ = true ;
    }
    return lookahead_ ;
}

Token Lexer::next() {
    if ( has_lookahead_ ) {
        has_lookahead_ = false ;
        return lookahead_ ;
    }
    return scan() ;
}

void Lexer::throwException(const string &msg, size_t pos) {
    throw ParseException(msg, pos) ;
}

void Lexer::skipSpace() {
    while ( pos_ < end_ && isspace((unsigned char)src_[pos_]) ) ++pos_ ;
}

Token Lexer::scan() {
    skipSpace() ;

    Token tok ;
    tok.pos_ = pos_ ;

    if ( pos_ >= end_ ) {
        tok.type_ = Token::End ;
        return tok ;
    }

    if ( scanNumber(tok) || scanString(tok) || scanName(tok) || scanOperator(tok) )
        return tok ;

    throwException(string("Unexpected character '") + src_[pos_] + "'", pos_) ;
}

// integer or float literal, integers too large for 64 bits become floats

bool Lexer::scanNumber(Token &tok) {
    size_t start = pos_, p = pos_ ;

    if ( !isdigit((unsigned char)src_[p]) ) return false ;

    while ( p < end_ && isdigit((unsigned char)src_[p]) ) ++p ;

    bool is_float = false ;

    if ( p + 1 < end_ && src_[p] == '.' && isdigit((unsigned char)src_[p+1]) ) {
        is_float = true ;
        ++p ;
        while ( p < end_ && isdigit((unsigned char)src_[p]) ) ++p ;
    }

    if ( p < end_ && ( src_[p] == 'e' || src_[p] == 'E' ) ) {
        size_t q = p + 1 ;
        if ( q < end_ && ( src_[q] == '+' || src_[q] == '-' ) ) ++q ;
        if ( q < end_ && isdigit((unsigned char)src_[q]) ) {
            is_float = true ;
            p = q ;
            while ( p < end_ && isdigit((unsigned char)src_[p]) ) ++p ;
        }
    }

    if ( p < end_ && is_name_char(src_[p]) )
        throwException("Invalid numeric literal", start) ;

    string text = src_.substr(start, p - start) ;
    pos_ = p ;

    tok.text_ = text ;

    if ( !is_float ) {
        errno = 0 ;
        long long number = strtoll(text.c_str(), nullptr, 10) ;
        if ( errno != ERANGE ) {
            tok.type_ = Token::Integer ;
            tok.val_ = Value((int64_t)number) ;
            return true ;
        }
    }

    tok.type_ = Token::Float ;
    tok.val_ = Value(strtod(text.c_str(), nullptr)) ;
    return true ;
}

// single or double quoted string with backslash escapes

bool Lexer::scanString(Token &tok) {
    char quote = src_[pos_] ;
    if ( quote != '"' && quote != '\'' ) return false ;

    size_t start = pos_ ;
    ++pos_ ;

    string res ;
    while ( pos_ < end_ ) {
        char c = src_[pos_++] ;
        if ( c == quote ) {
            tok.type_ = Token::String ;
            tok.text_ = res ;
            return true ;
        }
        else if ( c == '\\' ) {
            if ( pos_ >= end_ ) break ;
            char escape = src_[pos_++] ;
            switch ( escape ) {
            case 'n': res += '\n' ; break ;
            case 't': res += '\t' ; break ;
            case 'r': res += '\r' ; break ;
            case '0': res += '\0' ; break ;
            default:
                res += escape ; break ;
            }
        }
        else res += c ;
    }

    throwException("Unterminated string literal", start) ;
}

bool Lexer::scanName(Token &tok) {
    char c = src_[pos_] ;

    if ( c == '$' ) {
        size_t start = pos_++ ;
        while ( pos_ < end_ && is_name_char(src_[pos_]) ) ++pos_ ;
        tok.type_ = Token::Variable ;
        tok.text_ = src_.substr(start, pos_ - start) ;
        return true ;
    }

    if ( !is_name_start(c) ) return false ;

    size_t start = pos_ ;
    while ( pos_ < end_ && is_name_char(src_[pos_]) ) ++pos_ ;

    tok.type_ = Token::Name ;
    tok.text_ = src_.substr(start, pos_ - start) ;
    return true ;
}

bool Lexer::scanOperator(Token &tok) {
    char c = src_[pos_] ;
    char n = ( pos_ + 1 < end_ ) ? src_[pos_ + 1] : 0 ;

    auto one = [&](Token::Type t) -> bool { tok.type_ = t ; tok.text_ = string(1, c) ; pos_ += 1 ; return true ; } ;
    auto two = [&](Token::Type t) -> bool { tok.type_ = t ; tok.text_ = src_.substr(pos_, 2) ; pos_ += 2 ; return true ; } ;

    switch ( c ) {
    case '(': return one(Token::LeftParen) ;
    case ')': return one(Token::RightParen) ;
    case ',': return one(Token::Comma) ;
    case '.': return one(Token::Dot) ;
    case '?': return one(Token::Question) ;
    case ':': return one(Token::Colon) ;
    case '+': return one(Token::Plus) ;
    case '-': return one(Token::Minus) ;
    case '*': return one(Token::Star) ;
    case '/': return one(Token::Slash) ;
    case '%': return one(Token::Percent) ;
    case '|':
        if ( n == '|' ) return two(Token::Or) ;
        return one(Token::Pipe) ;
    case '&':
        if ( n == '&' ) return two(Token::And) ;
        return false ;
    case '!':
        if ( n == '=' ) return two(Token::NotEqual) ;
        return one(Token::Not) ;
    case '=':
        if ( n == '=' ) return two(Token::Equal) ;
        return false ;
    case '<':
        if ( n == '=' ) return two(Token::LessEqual) ;
        return one(Token::Less) ;
    case '>':
        if ( n == '=' ) return two(Token::GreaterEqual) ;
        return one(Token::Greater) ;
    default:
        return false ;
    }
}

string Lexer::scanSegment() {
    size_t start = pos_ ;
    while ( pos_ < end_ && is_segment_char(src_[pos_]) ) ++pos_ ;
    if ( pos_ == start )
        throwException("Expected path segment", start) ;
    return src_.substr(start, pos_ - start) ;
}

string Lexer::scanPath() {
    string path ;

    if ( pos_ >= end_ || src_[pos_] != '.' ) return path ;

    ++pos_ ;
    path = scanSegment() ;

    while ( pos_ + 1 < end_ && src_[pos_] == '.' && is_segment_char(src_[pos_+1]) ) {
        ++pos_ ;
        path += '.' + scanSegment() ;
    }

    return path ;
}

}
}
