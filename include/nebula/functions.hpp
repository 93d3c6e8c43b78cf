#ifndef NEBULA_FUNCTIONS_HPP__
#define NEBULA_FUNCTIONS_HPP__

#include <string>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include <nebula/value.hpp>

namespace nebula {

// A function callable from a template. Receives the evaluated arguments in order; in a
// pipeline stage the first argument is the value flowing through the pipe.

using Function = std::function<Value(const Value::Array &)>;

// Unpack the arguments passed to the function to the list of expected arguments.
// The named_args is a list of argument names. If ending with '?' the argument is optional.
// Non supplied optional arguments are given a null value.
// Throws SignatureError if a required argument is missing or too many arguments are given.

void unpack_args(const std::string &function, const Value::Array &args,
                 const std::vector<std::string> &named_args, Value::Array &res) ;

// Call f and report any failure that is not a TemplateException as FunctionError
Value call_function(const std::string &name, const Function &f, const Value::Array &args) ;

class FunctionRegistry {
public:

    // empty registry
    FunctionRegistry() = default ;

    // registry populated with the standard functions (upper, lower, join, default, ...)
    static FunctionRegistry withBuiltins() ;

    // shared instance of withBuiltins(), never modified
    static std::shared_ptr<const FunctionRegistry> builtins() {
        static const std::shared_ptr<const FunctionRegistry> s_instance =
                std::make_shared<const FunctionRegistry>(withBuiltins()) ;
        return s_instance ;
    }

    void registerFunction(const std::string &name, const Function &f);

    bool hasFunction(const std::string &name) const ;

    // nullptr if there is no such function
    const Function *lookup(const std::string &name) const ;

    // Throws FunctionError if the function is not registered or fails
    Value invoke(const std::string &name, const Value::Array &args) const ;

    // registered names in sorted order
    std::vector<std::string> names() const ;

private:

    std::map<std::string, Function> functions_ ;
};

}

#endif
