#ifndef NEBULA_EXPRESSION_HPP
#define NEBULA_EXPRESSION_HPP

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nebula/value.hpp>
#include <nebula/context.hpp>
#include <nebula/functions.hpp>

namespace nebula {

enum class BinaryOperator {
    Add, Subtract, Multiply, Divide, Modulo,
    Equal, NotEqual, LessThan, LessEqual, GreaterThan, GreaterEqual,
    And, Or,
    Contains, StartsWith, EndsWith
};

enum class UnaryOperator { Not, Minus } ;

// e.g. "Add", "LessEqual"
const char *operatorName(BinaryOperator op) ;
// e.g. "+", "<=", "contains"
const char *operatorSymbol(BinaryOperator op) ;

// Everything an expression or template reads, found without evaluating it

struct Dependencies {
    std::set<std::string> input_paths ; // "" stands for the whole input
    std::set<std::string> node_ids ;
    std::set<std::string> env_vars ;
    std::set<std::string> functions ;
    bool uses_system = false ;
    bool uses_execution = false ;
    bool uses_workflow = false ;

    void merge(const Dependencies &other) ;
};

class ExpressionAst ;
using ExpressionPtr = std::shared_ptr<const ExpressionAst> ;

struct PipelineStage {
    std::string name ;
    std::vector<ExpressionPtr> args ;
};

// Node of a parsed expression. Nodes are immutable once built and may be shared between
// templates and threads.

class ExpressionAst {
public:

    enum class Type { Literal, DataAccess, FunctionCall, Pipeline, BinaryOp, UnaryOp, Ternary, IfFunction } ;

    static ExpressionPtr literal(const Value &v) ;
    static ExpressionPtr dataAccess(const DataSource &source, const std::string &path) ;
    static ExpressionPtr functionCall(const std::string &name, const std::vector<ExpressionPtr> &args) ;
    static ExpressionPtr pipeline(const ExpressionPtr &input, const std::vector<PipelineStage> &stages) ;
    static ExpressionPtr binaryOp(const ExpressionPtr &left, BinaryOperator op, const ExpressionPtr &right) ;
    static ExpressionPtr unaryOp(UnaryOperator op, const ExpressionPtr &operand) ;
    static ExpressionPtr ternary(const ExpressionPtr &cond, const ExpressionPtr &then_expr, const ExpressionPtr &else_expr) ;
    // else_expr may be null
    static ExpressionPtr ifFunction(const ExpressionPtr &cond, const ExpressionPtr &then_expr, const ExpressionPtr &else_expr) ;

    Type type() const { return type_ ; }

    // Literal
    const Value &value() const { return value_ ; }

    // DataAccess
    const DataSource &source() const { return source_ ; }
    const std::string &path() const { return name_ ; }

    // FunctionCall
    const std::string &name() const { return name_ ; }
    const std::vector<ExpressionPtr> &args() const { return children_ ; }

    // Pipeline
    const ExpressionPtr &input() const { return children_[0] ; }
    const std::vector<PipelineStage> &stages() const { return stages_ ; }

    // BinaryOp
    const ExpressionPtr &left() const { return children_[0] ; }
    const ExpressionPtr &right() const { return children_[1] ; }
    BinaryOperator binaryOperator() const { return bop_ ; }

    // UnaryOp
    UnaryOperator unaryOperator() const { return uop_ ; }
    const ExpressionPtr &operand() const { return children_[0] ; }

    // Ternary and IfFunction, elseBranch() is null for an if() without else
    const ExpressionPtr &condition() const { return children_[0] ; }
    const ExpressionPtr &thenBranch() const { return children_[1] ; }
    const ExpressionPtr &elseBranch() const { return children_[2] ; }

    // Evaluates the tree against the context, calling functions through the registry.
    // Throws a TemplateException subclass on the first failure.
    Value evaluate(const Context &ctx, const FunctionRegistry &registry) const ;

    // Adds every data reference and function name of the tree, including both branches of
    // conditionals, to deps.
    void collectDependencies(Dependencies &deps) const ;

    // canonical source form
    std::string toString() const ;

private:

    explicit ExpressionAst(Type t): type_(t), source_(DataSource::input()) {}

    Value evalBinary(const Context &ctx, const FunctionRegistry &registry) const ;
    Value evalUnary(const Context &ctx, const FunctionRegistry &registry) const ;

    Type type_ ;
    Value value_ ;
    DataSource source_ ;
    std::string name_ ;
    std::vector<ExpressionPtr> children_ ;
    std::vector<PipelineStage> stages_ ;
    BinaryOperator bop_ = BinaryOperator::Add ;
    UnaryOperator uop_ = UnaryOperator::Not ;
};

}

#endif
