#include <nebula/expression.hpp>
#include <nebula/exceptions.hpp>

#include <sstream>

using namespace std ;

namespace nebula {

const char *operatorName(BinaryOperator op) {
    switch ( op ) {
    case BinaryOperator::Add: return "Add" ;
    case BinaryOperator::Subtract: return "Subtract" ;
    case BinaryOperator::Multiply: return "Multiply" ;
    case BinaryOperator::Divide: return "Divide" ;
    case BinaryOperator::Modulo: return "Modulo" ;
    case BinaryOperator::Equal: return "Equal" ;
    case BinaryOperator::NotEqual: return "NotEqual" ;
    case BinaryOperator::LessThan: return "LessThan" ;
    case BinaryOperator::LessEqual: return "LessEqual" ;
    case BinaryOperator::GreaterThan: return "GreaterThan" ;
    case BinaryOperator::GreaterEqual: return "GreaterEqual" ;
    case BinaryOperator::And: return "And" ;
    case BinaryOperator::Or: return "Or" ;
    case BinaryOperator::Contains: return "Contains" ;
    case BinaryOperator::StartsWith: return "StartsWith" ;
    case BinaryOperator::EndsWith: return "EndsWith" ;
    }
    return "" ;
}

const char *operatorSymbol(BinaryOperator op) {
    switch ( op ) {
    case BinaryOperator::Add: return "+" ;
    case BinaryOperator::Subtract: return "-" ;
    case BinaryOperator::Multiply: return "*" ;
    case BinaryOperator::Divide: return "/" ;
    case BinaryOperator::Modulo: return "%" ;
    case BinaryOperator::Equal: return "==" ;
    case BinaryOperator::NotEqual: return "!=" ;
    case BinaryOperator::LessThan: return "<" ;
    case BinaryOperator::LessEqual: return "<=" ;
    case BinaryOperator::GreaterThan: return ">" ;
    case BinaryOperator::GreaterEqual: return ">=" ;
    case BinaryOperator::And: return "&&" ;
    case BinaryOperator::Or: return "||" ;
    case BinaryOperator::Contains: return "contains" ;
    case BinaryOperator::StartsWith: return "startsWith" ;
    case BinaryOperator::EndsWith: return "endsWith" ;
    }
    return "" ;
}

void Dependencies::merge(const Dependencies &other) {
    input_paths.insert(other.input_paths.begin(), other.input_paths.end()) ;
    node_ids.insert(other.node_ids.begin(), other.node_ids.end()) ;
    env_vars.insert(other.env_vars.begin(), other.env_vars.end()) ;
    functions.insert(other.functions.begin(), other.functions.end()) ;
    uses_system = uses_system || other.uses_system ;
    uses_execution = uses_execution || other.uses_execution ;
    uses_workflow = uses_workflow || other.uses_workflow ;
}

ExpressionPtr ExpressionAst::literal(const Value &v) {
    ExpressionAst *node = new ExpressionAst(Type::Literal) ;
    node->value_ = v ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::dataAccess(const DataSource &source, const string &path) {
    ExpressionAst *node = new ExpressionAst(Type::DataAccess) ;
    node->source_ = source ;
    node->name_ = path ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::functionCall(const string &name, const vector<ExpressionPtr> &args) {
    ExpressionAst *node = new ExpressionAst(Type::FunctionCall) ;
    node->name_ = name ;
    node->children_ = args ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::pipeline(const ExpressionPtr &input, const vector<PipelineStage> &stages) {
    ExpressionAst *node = new ExpressionAst(Type::Pipeline) ;
    node->children_ = { input } ;
    node->stages_ = stages ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::binaryOp(const ExpressionPtr &left, BinaryOperator op, const ExpressionPtr &right) {
    ExpressionAst *node = new ExpressionAst(Type::BinaryOp) ;
    node->children_ = { left, right } ;
    node->bop_ = op ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::unaryOp(UnaryOperator op, const ExpressionPtr &operand) {
    ExpressionAst *node = new ExpressionAst(Type::UnaryOp) ;
    node->children_ = { operand } ;
    node->uop_ = op ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::ternary(const ExpressionPtr &cond, const ExpressionPtr &then_expr, const ExpressionPtr &else_expr) {
    ExpressionAst *node = new ExpressionAst(Type::Ternary) ;
    node->children_ = { cond, then_expr, else_expr } ;
    return ExpressionPtr(node) ;
}

ExpressionPtr ExpressionAst::ifFunction(const ExpressionPtr &cond, const ExpressionPtr &then_expr, const ExpressionPtr &else_expr) {
    ExpressionAst *node = new ExpressionAst(Type::IfFunction) ;
    node->children_ = { cond, then_expr, else_expr } ;
    return ExpressionPtr(node) ;
}

static Value::Array eval_args(const vector<ExpressionPtr> &args, const Context &ctx, const FunctionRegistry &registry) {
    Value::Array res ;
    for( const ExpressionPtr &e: args )
        res.push_back(e->evaluate(ctx, registry)) ;
    return res ;
}

static const Function &find_function(const FunctionRegistry &registry, const string &name) {
    const Function *f = registry.lookup(name) ;
    if ( f == nullptr )
        throw FunctionError(name, "Function not found") ;
    return *f ;
}

Value ExpressionAst::evaluate(const Context &ctx, const FunctionRegistry &registry) const {

    switch ( type_ ) {
    case Type::Literal:
        return value_ ;

    case Type::DataAccess:
        return ctx.resolveDataSource(source_, name_) ;

    case Type::FunctionCall: {
        const Function &f = find_function(registry, name_) ;
        Value::Array args = eval_args(children_, ctx, registry) ;
        return call_function(name_, f, args) ;
    }

    case Type::Pipeline: {
        Value current = input()->evaluate(ctx, registry) ;

        for( const PipelineStage &stage: stages_ ) {
            const Function &f = find_function(registry, stage.name) ;

            Value::Array args{ current } ;
            for( const ExpressionPtr &e: stage.args )
                args.push_back(e->evaluate(ctx, registry)) ;

            current = call_function(stage.name, f, args) ;
        }

        return current ;
    }

    case Type::BinaryOp:
        return evalBinary(ctx, registry) ;

    case Type::UnaryOp:
        return evalUnary(ctx, registry) ;

    case Type::Ternary:
    case Type::IfFunction: {
        if ( condition()->evaluate(ctx, registry).isTruthy() )
            return thenBranch()->evaluate(ctx, registry) ;
        else if ( elseBranch() )
            return elseBranch()->evaluate(ctx, registry) ;
        else
            return Value::null() ;
    }
    }

    throw EvaluationError("Unknown expression node", toString()) ;
}

// numeric operands are always combined as floats

static Value arithmetic(const Value &op1, const Value &op2, BinaryOperator op) {
    double a = op1.asFloat(), b = op2.asFloat() ;

    switch ( op ) {
    case BinaryOperator::Add:
        return a + b ;
    case BinaryOperator::Subtract:
        return a - b ;
    default:
        return a * b ;
    }
}

Value ExpressionAst::evalBinary(const Context &ctx, const FunctionRegistry &registry) const
{
    Value op1 = left()->evaluate(ctx, registry) ;
    Value op2 = right()->evaluate(ctx, registry) ;

    switch ( bop_ ) {
    case BinaryOperator::Add:
        if ( op1.isNumber() && op2.isNumber() )
            return arithmetic(op1, op2, bop_) ;
        return op1.asString() + op2.asString() ;
    case BinaryOperator::Subtract:
    case BinaryOperator::Multiply:
        return arithmetic(op1, op2, bop_) ;
    case BinaryOperator::Divide: {
        double divisor = op2.asFloat() ;
        if ( divisor == 0.0 ) throw MathError("Division by zero") ;
        return op1.asFloat() / divisor ;
    }
    case BinaryOperator::Equal:
        return op1 == op2 ;
    case BinaryOperator::NotEqual:
        return op1 != op2 ;
    case BinaryOperator::LessThan:
        return op1.asFloat() < op2.asFloat() ;
    case BinaryOperator::And:
        return op1.isTruthy() && op2.isTruthy() ;
    case BinaryOperator::Or:
        return op1.isTruthy() || op2.isTruthy() ;
    case BinaryOperator::Modulo:
    case BinaryOperator::LessEqual:
    case BinaryOperator::GreaterThan:
    case BinaryOperator::GreaterEqual:
    case BinaryOperator::Contains:
    case BinaryOperator::StartsWith:
    case BinaryOperator::EndsWith:
        throw EvaluationError(string("Operator ") + operatorName(bop_) + " not implemented", toString()) ;
    }

    throw EvaluationError(string("Unknown operator ") + operatorName(bop_), toString()) ;
}

Value ExpressionAst::evalUnary(const Context &ctx, const FunctionRegistry &registry) const
{
    Value val = operand()->evaluate(ctx, registry) ;

    switch ( uop_ ) {
    case UnaryOperator::Not:
        return !val.isTruthy() ;
    case UnaryOperator::Minus:
        return -val.asFloat() ;
    }

    throw EvaluationError("Unknown unary operator", toString()) ;
}

void ExpressionAst::collectDependencies(Dependencies &deps) const {

    switch ( type_ ) {
    case Type::Literal:
        break ;
    case Type::DataAccess:
        switch ( source_.kind() ) {
        case DataSource::Kind::Input:
            deps.input_paths.insert(name_) ;
            break ;
        case DataSource::Kind::Node:
            deps.node_ids.insert(source_.nodeId()) ;
            break ;
        case DataSource::Kind::Environment:
            deps.env_vars.insert(name_) ;
            break ;
        case DataSource::Kind::System:
            deps.uses_system = true ;
            break ;
        case DataSource::Kind::Execution:
            deps.uses_execution = true ;
            break ;
        case DataSource::Kind::Workflow:
            deps.uses_workflow = true ;
            break ;
        }
        break ;
    case Type::FunctionCall:
        deps.functions.insert(name_) ;
        for( const ExpressionPtr &e: children_ )
            e->collectDependencies(deps) ;
        break ;
    case Type::Pipeline:
        input()->collectDependencies(deps) ;
        for( const PipelineStage &stage: stages_ ) {
            deps.functions.insert(stage.name) ;
            for( const ExpressionPtr &e: stage.args )
                e->collectDependencies(deps) ;
        }
        break ;
    case Type::BinaryOp:
    case Type::UnaryOp:
    case Type::Ternary:
    case Type::IfFunction:
        for( const ExpressionPtr &e: children_ )
            if ( e ) e->collectDependencies(deps) ;
        break ;
    }
}

static void write_args(ostream &strm, const vector<ExpressionPtr> &args) {
    strm << '(' ;
    for( size_t i = 0 ; i < args.size() ; i++ ) {
        if ( i > 0 ) strm << ", " ;
        strm << args[i]->toString() ;
    }
    strm << ')' ;
}

string ExpressionAst::toString() const {
    ostringstream strm ;

    switch ( type_ ) {
    case Type::Literal:
        value_.toJSON(strm) ;
        break ;
    case Type::DataAccess:
        if ( source_.kind() == DataSource::Kind::Node )
            strm << "$node('" << source_.nodeId() << "')" ;
        else
            strm << source_.name() ;
        if ( !name_.empty() ) strm << '.' << name_ ;
        break ;
    case Type::FunctionCall:
        strm << name_ ;
        write_args(strm, children_) ;
        break ;
    case Type::Pipeline:
        strm << input()->toString() ;
        for( const PipelineStage &stage: stages_ ) {
            strm << " | " << stage.name ;
            if ( !stage.args.empty() ) write_args(strm, stage.args) ;
        }
        break ;
    case Type::BinaryOp:
        strm << '(' << left()->toString() << ' ' << operatorSymbol(bop_) << ' ' << right()->toString() << ')' ;
        break ;
    case Type::UnaryOp:
        strm << ( uop_ == UnaryOperator::Not ? "!" : "-" ) << operand()->toString() ;
        break ;
    case Type::Ternary:
        strm << '(' << condition()->toString() << " ? " << thenBranch()->toString() << " : " << elseBranch()->toString() << ')' ;
        break ;
    case Type::IfFunction:
        strm << "if(" << condition()->toString() << ", " << thenBranch()->toString() ;
        if ( elseBranch() ) strm << ", " << elseBranch()->toString() ;
        strm << ')' ;
        break ;
    }

    return strm.str() ;
}

}
