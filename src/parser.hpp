#ifndef NEBULA_PARSER_HPP
#define NEBULA_PARSER_HPP

#include <string>
#include <vector>

#include <nebula/template.hpp>

#include "lexer.hpp"

namespace nebula {
namespace detail {

/*
 * Expression = Ternary ( '|' Stage )*
 * Stage = Name ( '(' ( Expression ( ',' Expression )* )? ')' )?
 * Ternary = Or ( '?' Ternary ':' Ternary )?
 * Or = And ( '||' And )*
 * And = Equality ( '&&' Equality )*
 * Equality = Comparison ( ( '==' | '!=' ) Comparison )*
 * Comparison = Additive ( ( '<' | '<=' | '>' | '>=' | 'contains' | 'startsWith' | 'endsWith' ) Additive )*
 * Additive = Multiplicative ( ( '+' | '-' ) Multiplicative )*
 * Multiplicative = Unary ( ( '*' | '/' | '%' ) Unary )*
 * Unary = ( '!' | '-' ) Unary | Primary
 * Primary = Literal | DataAccess | 'if' '(' Args ')' | Name '(' Args ')' | '(' Expression ')'
 * DataAccess = '$input' Path? | '$node' '(' String ')' ( '.json' )? Path? | '$env' Path
 *            | '$system' Path? | '$execution' Path? | '$workflow' Path?
 * Path = ( '.' [A-Za-z0-9_-]+ )+
 */

class Parser {
public:
    Parser(const std::string &src): src_(src) {}

    // Split the source into text and expression elements. Throws ParseException.
    void parse(std::vector<TemplateElement> &elements) ;

private:

    // offset of the }} closing the expression starting at start, npos if unclosed
    size_t findExpressionEnd(size_t start) const ;

    ExpressionPtr parseExpression(Lexer &lexer) ;
    ExpressionPtr parseTernary(Lexer &lexer) ;
    ExpressionPtr parseOr(Lexer &lexer) ;
    ExpressionPtr parseAnd(Lexer &lexer) ;
    ExpressionPtr parseEquality(Lexer &lexer) ;
    ExpressionPtr parseComparison(Lexer &lexer) ;
    ExpressionPtr parseAdditive(Lexer &lexer) ;
    ExpressionPtr parseMultiplicative(Lexer &lexer) ;
    ExpressionPtr parseUnary(Lexer &lexer) ;
    ExpressionPtr parsePrimary(Lexer &lexer) ;
    ExpressionPtr parseDataAccess(Lexer &lexer, const Token &tok) ;
    ExpressionPtr parseName(Lexer &lexer, const Token &tok) ;
    std::vector<ExpressionPtr> parseArgs(Lexer &lexer) ;

    Token expect(Lexer &lexer, Token::Type type, const char *what) ;

    [[noreturn]] void throwException(const std::string &msg, size_t pos) ;

    const std::string &src_ ;
};

}
}

#endif
