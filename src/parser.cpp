#include "parser.hpp"

#include <cctype>

using namespace std ;

namespace nebula {
namespace detail {

void Parser::throwException(const string &msg, size_t pos) {
    throw ParseException(msg, pos) ;
}

static string trim_copy(const string &src, size_t start, size_t end) {
    while ( start < end && isspace((unsigned char)src[start]) ) ++start ;
    while ( end > start && isspace((unsigned char)src[end-1]) ) --end ;
    return src.substr(start, end - start) ;
}

void Parser::parse(vector<TemplateElement> &elements) {
    size_t pos = 0 ;
    string text ;

    while ( pos < src_.length() ) {
        size_t open = src_.find("{{", pos) ;

        if ( open == string::npos ) {
            text.append(src_, pos, string::npos) ;
            break ;
        }

        size_t text_end = open ;

        // \\{{ is a backslash followed by an expression, \{{ is a literal {{
        if ( open >= pos + 2 && src_[open-1] == '\\' && src_[open-2] == '\\' )
            text_end = open - 1 ;
        else if ( open > pos && src_[open-1] == '\\' ) {
            text.append(src_, pos, open - 1 - pos) ;
            text.append("{{") ;
            pos = open + 2 ;
            continue ;
        }

        text.append(src_, pos, text_end - pos) ;
        if ( !text.empty() ) {
            elements.push_back(TemplateElement::text(text)) ;
            text.clear() ;
        }

        size_t close = findExpressionEnd(open + 2) ;
        if ( close == string::npos )
            throwException("Unclosed expression", open) ;

        Lexer lexer(src_, open + 2, close) ;

        if ( lexer.peek().type_ == Token::End )
            throwException("Empty expression", open) ;

        ExpressionPtr ast = parseExpression(lexer) ;

        const Token &tok = lexer.peek() ;
        if ( tok.type_ != Token::End )
            throwException("Unexpected token '" + tok.text_ + "'", tok.pos_) ;

        elements.push_back(TemplateElement::expression(Expression(trim_copy(src_, open + 2, close), ast, open))) ;

        pos = close + 2 ;
    }

    if ( !text.empty() )
        elements.push_back(TemplateElement::text(text)) ;
}

// a }} inside a quoted string does not close the expression

size_t Parser::findExpressionEnd(size_t start) const {
    size_t n = src_.length() ;
    size_t i = start ;

    while ( i < n ) {
        char c = src_[i] ;
        if ( c == '"' || c == '\'' ) {
            ++i ;
            while ( i < n && src_[i] != c ) {
                if ( src_[i] == '\\' ) ++i ;
                ++i ;
            }
            if ( i >= n ) return string::npos ;
            ++i ;
        }
        else if ( c == '}' && i + 1 < n && src_[i+1] == '}' )
            return i ;
        else
            ++i ;
    }

    return string::npos ;
}

Token Parser::expect(Lexer &lexer, Token::Type type, const char *what) {
    Token tok = lexer.next() ;
    if ( tok.type_ != type ) {
        if ( tok.type_ == Token::End )
            throwException(string("Expected ") + what + " but reached end of expression", tok.pos_) ;
        else
            throwException(string("Expected ") + what + " but found '" + tok.text_ + "'", tok.pos_) ;
    }
    return tok ;
}

ExpressionPtr Parser::parseExpression(Lexer &lexer) {
    ExpressionPtr input = parseTernary(lexer) ;

    vector<PipelineStage> stages ;

    while ( lexer.peek().type_ == Token::Pipe ) {
        lexer.next() ;

        PipelineStage stage ;
        stage.name = expect(lexer, Token::Name, "function name").text_ ;

        if ( lexer.peek().type_ == Token::LeftParen )
            stage.args = parseArgs(lexer) ;

        stages.push_back(stage) ;
    }

    if ( stages.empty() ) return input ;
    else return ExpressionAst::pipeline(input, stages) ;
}

ExpressionPtr Parser::parseTernary(Lexer &lexer) {
    ExpressionPtr cond = parseOr(lexer) ;

    if ( lexer.peek().type_ != Token::Question ) return cond ;
    lexer.next() ;

    ExpressionPtr then_expr = parseTernary(lexer) ;
    expect(lexer, Token::Colon, "':'") ;
    ExpressionPtr else_expr = parseTernary(lexer) ;

    return ExpressionAst::ternary(cond, then_expr, else_expr) ;
}

ExpressionPtr Parser::parseOr(Lexer &lexer) {
    ExpressionPtr lhs = parseAnd(lexer) ;

    while ( lexer.peek().type_ == Token::Or ) {
        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, BinaryOperator::Or, parseAnd(lexer)) ;
    }

    return lhs ;
}

ExpressionPtr Parser::parseAnd(Lexer &lexer) {
    ExpressionPtr lhs = parseEquality(lexer) ;

    while ( lexer.peek().type_ == Token::And ) {
        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, BinaryOperator::And, parseEquality(lexer)) ;
    }

    return lhs ;
}

ExpressionPtr Parser::parseEquality(Lexer &lexer) {
    ExpressionPtr lhs = parseComparison(lexer) ;

    while ( 1 ) {
        Token::Type t = lexer.peek().type_ ;

        BinaryOperator op ;
        if ( t == Token::Equal ) op = BinaryOperator::Equal ;
        else if ( t == Token::NotEqual ) op = BinaryOperator::NotEqual ;
        else return lhs ;

        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, op, parseComparison(lexer)) ;
    }
}

ExpressionPtr Parser::parseComparison(Lexer &lexer) {
    ExpressionPtr lhs = parseAdditive(lexer) ;

    while ( 1 ) {
        const Token &tok = lexer.peek() ;

        BinaryOperator op ;
        if ( tok.type_ == Token::Less ) op = BinaryOperator::LessThan ;
        else if ( tok.type_ == Token::LessEqual ) op = BinaryOperator::LessEqual ;
        else if ( tok.type_ == Token::Greater ) op = BinaryOperator::GreaterThan ;
        else if ( tok.type_ == Token::GreaterEqual ) op = BinaryOperator::GreaterEqual ;
        else if ( tok.type_ == Token::Name && tok.text_ == "contains" ) op = BinaryOperator::Contains ;
        else if ( tok.type_ == Token::Name && tok.text_ == "startsWith" ) op = BinaryOperator::StartsWith ;
        else if ( tok.type_ == Token::Name && tok.text_ == "endsWith" ) op = BinaryOperator::EndsWith ;
        else return lhs ;

        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, op, parseAdditive(lexer)) ;
    }
}

ExpressionPtr Parser::parseAdditive(Lexer &lexer) {
    ExpressionPtr lhs = parseMultiplicative(lexer) ;

    while ( 1 ) {
        Token::Type t = lexer.peek().type_ ;

        BinaryOperator op ;
        if ( t == Token::Plus ) op = BinaryOperator::Add ;
        else if ( t == Token::Minus ) op = BinaryOperator::Subtract ;
        else return lhs ;

        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, op, parseMultiplicative(lexer)) ;
    }
}

ExpressionPtr Parser::parseMultiplicative(Lexer &lexer) {
    ExpressionPtr lhs = parseUnary(lexer) ;

    while ( 1 ) {
        Token::Type t = lexer.peek().type_ ;

        BinaryOperator op ;
        if ( t == Token::Star ) op = BinaryOperator::Multiply ;
        else if ( t == Token::Slash ) op = BinaryOperator::Divide ;
        else if ( t == Token::Percent ) op = BinaryOperator::Modulo ;
        else return lhs ;

        lexer.next() ;
        lhs = ExpressionAst::binaryOp(lhs, op, parseUnary(lexer)) ;
    }
}

ExpressionPtr Parser::parseUnary(Lexer &lexer) {
    Token::Type t = lexer.peek().type_ ;

    if ( t == Token::Not ) {
        lexer.next() ;
        return ExpressionAst::unaryOp(UnaryOperator::Not, parseUnary(lexer)) ;
    }
    else if ( t == Token::Minus ) {
        lexer.next() ;

        // fold into a negative literal
        const Token &tok = lexer.peek() ;
        if ( tok.type_ == Token::Integer ) {
            int64_t v = tok.val_.asInteger() ;
            lexer.next() ;
            return ExpressionAst::literal(-v) ;
        }
        else if ( tok.type_ == Token::Float ) {
            double v = tok.val_.asFloat() ;
            lexer.next() ;
            return ExpressionAst::literal(-v) ;
        }

        return ExpressionAst::unaryOp(UnaryOperator::Minus, parseUnary(lexer)) ;
    }

    return parsePrimary(lexer) ;
}

ExpressionPtr Parser::parsePrimary(Lexer &lexer) {
    Token tok = lexer.next() ;

    switch ( tok.type_ ) {
    case Token::Integer:
    case Token::Float:
        return ExpressionAst::literal(tok.val_) ;
    case Token::String:
        return ExpressionAst::literal(Value(tok.text_)) ;
    case Token::Variable:
        return parseDataAccess(lexer, tok) ;
    case Token::Name:
        return parseName(lexer, tok) ;
    case Token::LeftParen: {
        ExpressionPtr e = parseExpression(lexer) ;
        expect(lexer, Token::RightParen, "')'") ;
        return e ;
    }
    case Token::End:
        throwException("Unexpected end of expression", tok.pos_) ;
    default:
        throwException("Unexpected token '" + tok.text_ + "'", tok.pos_) ;
    }
}

// literal keyword, if(...) or function call

ExpressionPtr Parser::parseName(Lexer &lexer, const Token &tok) {
    const string &name = tok.text_ ;

    if ( name == "null" ) return ExpressionAst::literal(Value()) ;
    if ( name == "true" ) return ExpressionAst::literal(Value(true)) ;
    if ( name == "false" ) return ExpressionAst::literal(Value(false)) ;

    if ( lexer.peek().type_ != Token::LeftParen )
        throwException("Unknown literal type", tok.pos_) ;

    vector<ExpressionPtr> args = parseArgs(lexer) ;

    if ( name == "if" ) {
        if ( args.size() != 2 && args.size() != 3 )
            throwException("If function requires 2 or 3 arguments", tok.pos_) ;

        return ExpressionAst::ifFunction(args[0], args[1], args.size() == 3 ? args[2] : ExpressionPtr()) ;
    }

    return ExpressionAst::functionCall(name, args) ;
}

vector<ExpressionPtr> Parser::parseArgs(Lexer &lexer) {
    vector<ExpressionPtr> args ;

    expect(lexer, Token::LeftParen, "'('") ;

    if ( lexer.peek().type_ == Token::RightParen ) {
        lexer.next() ;
        return args ;
    }

    while ( 1 ) {
        args.push_back(parseExpression(lexer)) ;

        Token tok = lexer.next() ;
        if ( tok.type_ == Token::RightParen ) break ;
        else if ( tok.type_ != Token::Comma ) {
            if ( tok.type_ == Token::End )
                throwException("Expected ')' but reached end of expression", tok.pos_) ;
            throwException("Expected ',' or ')' but found '" + tok.text_ + "'", tok.pos_) ;
        }
    }

    return args ;
}

ExpressionPtr Parser::parseDataAccess(Lexer &lexer, const Token &tok) {
    const string &name = tok.text_ ;

    if ( name == "$input" )
        return ExpressionAst::dataAccess(DataSource::input(), lexer.scanPath()) ;
    else if ( name == "$system" )
        return ExpressionAst::dataAccess(DataSource::system(), lexer.scanPath()) ;
    else if ( name == "$execution" )
        return ExpressionAst::dataAccess(DataSource::execution(), lexer.scanPath()) ;
    else if ( name == "$workflow" )
        return ExpressionAst::dataAccess(DataSource::workflow(), lexer.scanPath()) ;
    else if ( name == "$env" ) {
        size_t pos = lexer.position() ;
        string key = lexer.scanPath() ;
        if ( key.empty() )
            throwException("Expected environment variable name", pos) ;
        return ExpressionAst::dataAccess(DataSource::environment(), key) ;
    }
    else if ( name == "$node" ) {
        expect(lexer, Token::LeftParen, "'('") ;
        string id = expect(lexer, Token::String, "node id").text_ ;
        expect(lexer, Token::RightParen, "')'") ;

        string path = lexer.scanPath() ;
        if ( path.compare(0, 5, "json.") == 0 ) path = path.substr(5) ;

        return ExpressionAst::dataAccess(DataSource::node(id), path) ;
    }

    throwException("Unknown data source", tok.pos_) ;
}

}
}
