#include <nebula/template.hpp>
#include <nebula/exceptions.hpp>

#include "parser.hpp"

using namespace std ;

namespace nebula {

Template Template::parse(const string &source) {
    return parseWithFunctions(source, FunctionRegistry::builtins()) ;
}

Template Template::parseWithFunctions(const string &source, const std::shared_ptr<const FunctionRegistry> &registry) {
    if ( !registry )
        throw TemplateException("No function registry given") ;

    Template t(source, registry) ;

    try {
        detail::Parser parser(t.source_) ;
        parser.parse(t.elements_) ;
    }
    catch ( detail::ParseException &e ) {
        throw ParseError(e.msg_, e.pos_, source) ;
    }

    for( const TemplateElement &e: t.elements_ ) {
        if ( e.isExpression() )
            e.expression().ast()->collectDependencies(t.dependencies_) ;
    }

    return t ;
}

vector<Expression> Template::expressions() const {
    vector<Expression> res ;
    for( const TemplateElement &e: elements_ ) {
        if ( e.isExpression() )
            res.push_back(e.expression()) ;
    }
    return res ;
}

size_t Template::expressionCount() const {
    size_t count = 0 ;
    for( const TemplateElement &e: elements_ ) {
        if ( e.isExpression() ) ++count ;
    }
    return count ;
}

bool Template::isStatic() const {
    return expressionCount() == 0 ;
}

string Template::render(const Context &ctx) const {
    string res ;

    for( const TemplateElement &e: elements_ ) {
        if ( e.isText() )
            res.append(e.text()) ;
        else
            res.append(e.expression().evaluate(ctx, *registry_).asString()) ;
    }

    return res ;
}

void Template::validateContext(const Context &ctx) const {

    if ( !dependencies_.input_paths.empty() && ctx.getInput() == nullptr )
        throw DataNotFound("$input", { "Input data required but not provided" }) ;

    for( const string &id: dependencies_.node_ids ) {
        if ( ctx.getNodeOutput(id) == nullptr )
            throw DataNotFound("$node('" + id + "')", ctx.availableDataSources()) ;
    }

    for( const string &key: dependencies_.env_vars ) {
        if ( ctx.getEnv(key) == nullptr )
            throw DataNotFound("$env." + key, { "Environment variable not set" }) ;
    }
}

}
