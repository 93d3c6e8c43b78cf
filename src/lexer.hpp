#ifndef NEBULA_LEXER_HPP
#define NEBULA_LEXER_HPP

#include <string>

#include <nebula/value.hpp>

namespace nebula {
namespace detail {

// error raised while scanning or parsing, converted to ParseError by Template::parse

class ParseException {
public:
    ParseException(const std::string &msg, size_t pos): msg_(msg), pos_(pos) {}

    std::string msg_ ;
    size_t pos_ ;
};

struct Token {
    enum Type { End, Integer, Float, String, Name, Variable,
                LeftParen, RightParen, Comma, Dot, Pipe, Question, Colon,
                Plus, Minus, Star, Slash, Percent, Not,
                Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual, And, Or } ;

    Type type_ = End ;
    std::string text_ ; // decoded string literal, identifier or variable name
    Value val_ ;        // numeric literal
    size_t pos_ = 0 ;   // offset in the full template source
};

// Splits the text between start and end of the template source into tokens.
// Paths following a data source reference are read raw with scanPath since their segments
// may start with digits or contain dashes.

class Lexer {
public:
    Lexer(const std::string &src, size_t start, size_t end): src_(src), pos_(start), end_(end) {}

    const Token &peek() ;
    Token next() ;

    // If the next character is '.' consume a dot separated path and return it.
    // Returns an empty string otherwise. Must not be called with a peeked token pending.
    std::string scanPath() ;

    size_t position() const { return pos_ ; }

private:

    Token scan() ;
    void skipSpace() ;
    bool scanNumber(Token &tok) ;
    bool scanString(Token &tok) ;
    bool scanName(Token &tok) ;
    bool scanOperator(Token &tok) ;
    std::string scanSegment() ;

    [[noreturn]] void throwException(const std::string &msg, size_t pos) ;

    const std::string &src_ ;
    size_t pos_, end_ ;
    Token lookahead_ ;
    bool has_lookahead_ = false ;
};

}
}

#endif
