#ifndef NEBULA_TEMPLATE_HPP
#define NEBULA_TEMPLATE_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nebula/context.hpp>
#include <nebula/expression.hpp>
#include <nebula/functions.hpp>

namespace nebula {

// an expression found between {{ and }}

class Expression {
public:
    Expression(const std::string &source, const ExpressionPtr &ast, size_t position):
        source_(source), ast_(ast), position_(position) {}

    // text between the delimiters, trimmed
    const std::string &source() const { return source_ ; }
    const ExpressionPtr &ast() const { return ast_ ; }
    // offset of the opening {{ in the template source
    size_t position() const { return position_ ; }

    Value evaluate(const Context &ctx, const FunctionRegistry &registry) const {
        return ast_->evaluate(ctx, registry) ;
    }

    Dependencies dependencies() const {
        Dependencies deps ;
        ast_->collectDependencies(deps) ;
        return deps ;
    }

private:
    std::string source_ ;
    ExpressionPtr ast_ ;
    size_t position_ ;
};

class TemplateElement {
public:
    enum class Type { Text, Expression } ;

    static TemplateElement text(const std::string &txt) {
        return TemplateElement(txt) ;
    }

    static TemplateElement expression(const Expression &e) {
        return TemplateElement(e) ;
    }

    Type type() const { return expr_ ? Type::Expression : Type::Text ; }

    bool isText() const { return !expr_ ; }
    bool isExpression() const { return (bool)expr_ ; }

    // empty for expressions
    const std::string &text() const { return text_ ; }

    // must only be called on expression elements
    const Expression &expression() const { return *expr_ ; }

private:
    explicit TemplateElement(const std::string &txt): text_(txt) {}
    explicit TemplateElement(const Expression &e): expr_(std::make_shared<const Expression>(e)) {}

    std::string text_ ;
    std::shared_ptr<const Expression> expr_ ;
};

// A parsed template. Immutable, so a single instance may be rendered concurrently with
// different contexts.
//
// e.g.  Template t = Template::parse("Hello {{ $input.name | upper }}!") ;
//       Context ctx ;
//       ctx.setInput(Value::Object{{"name", "Alice"}}) ;
//       cout << t.render(ctx) << endl ;   // Hello ALICE!

class Template {
public:

    // Parse using the standard function library. Throws ParseError on malformed input.
    static Template parse(const std::string &source) ;

    // Parse binding the given function registry
    static Template parseWithFunctions(const std::string &source,
                                       const std::shared_ptr<const FunctionRegistry> &registry) ;

    const std::string &source() const { return source_ ; }
    const std::vector<TemplateElement> &elements() const { return elements_ ; }
    std::vector<Expression> expressions() const ;
    size_t expressionCount() const ;

    // true if the template has no expressions
    bool isStatic() const ;

    const Dependencies &dependencies() const { return dependencies_ ; }
    bool usesFunction(const std::string &name) const { return dependencies_.functions.count(name) != 0 ; }
    const std::set<std::string> &functions() const { return dependencies_.functions ; }

    const FunctionRegistry &registry() const { return *registry_ ; }

    // Evaluate every expression and concatenate with the literal text.
    // Throws on the first failing expression.
    std::string render(const Context &ctx) const ;

    // Check that the input, nodes and environment variables referenced anywhere in the
    // template are present in the context. Throws DataNotFound otherwise.
    void validateContext(const Context &ctx) const ;

private:

    Template(const std::string &source, const std::shared_ptr<const FunctionRegistry> &registry):
        source_(source), registry_(registry) {}

    std::string source_ ;
    std::vector<TemplateElement> elements_ ;
    Dependencies dependencies_ ;
    std::shared_ptr<const FunctionRegistry> registry_ ;
};

}

#endif
