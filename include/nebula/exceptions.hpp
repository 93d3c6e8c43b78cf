#ifndef NEBULA_EXCEPTIONS_HPP__
#define NEBULA_EXCEPTIONS_HPP__

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace nebula {

// base class of all errors raised while parsing or rendering a template

class TemplateException: public std::runtime_error {
public:

    TemplateException(const std::string &msg): std::runtime_error(msg) {}
};

// malformed template syntax, raised only by Template::parse

class ParseError: public TemplateException {
public:
    ParseError(const std::string &msg, size_t position, const std::string &tmpl) ;

    const std::string &message() const { return message_ ; }
    size_t position() const { return position_ ; }
    const std::string &templateSource() const { return template_ ; }

private:
    std::string message_ ;
    size_t position_ ;
    std::string template_ ;
};

class EvaluationError: public TemplateException {
public:
    EvaluationError(const std::string &msg, const std::string &context = std::string()) ;

    const std::string &message() const { return message_ ; }
    // empty if no context was given
    const std::string &context() const { return context_ ; }

private:
    std::string message_, context_ ;
};

class FunctionError: public TemplateException {
public:
    FunctionError(const std::string &function, const std::string &msg,
                  const std::vector<std::string> &args = {}) ;

    const std::string &function() const { return function_ ; }
    const std::string &message() const { return message_ ; }
    const std::vector<std::string> &args() const { return args_ ; }

private:
    std::string function_, message_ ;
    std::vector<std::string> args_ ;
};

class TypeError: public TemplateException {
public:
    TypeError(const std::string &from, const std::string &to, const std::string &context = std::string()) ;

    const std::string &from() const { return from_ ; }
    const std::string &to() const { return to_ ; }
    const std::string &context() const { return context_ ; }

private:
    std::string from_, to_, context_ ;
};

// unresolved data source reference; available lists alternatives for diagnostics

class DataNotFound: public TemplateException {
public:
    DataNotFound(const std::string &path, const std::vector<std::string> &available) ;

    const std::string &path() const { return path_ ; }
    const std::vector<std::string> &available() const { return available_ ; }

private:
    std::string path_ ;
    std::vector<std::string> available_ ;
};

class SignatureError: public TemplateException {
public:
    SignatureError(const std::string &function, const std::string &msg) ;

    const std::string &function() const { return function_ ; }
    const std::string &message() const { return message_ ; }

private:
    std::string function_, message_ ;
};

class MathError: public TemplateException {
public:
    MathError(const std::string &msg) ;

    const std::string &message() const { return message_ ; }

private:
    std::string message_ ;
};

class IndexError: public TemplateException {
public:
    IndexError(int64_t index, size_t size) ;

    int64_t index() const { return index_ ; }
    size_t size() const { return size_ ; }

private:
    int64_t index_ ;
    size_t size_ ;
};

class JsonError: public TemplateException {
public:
    JsonError(const std::string &msg): TemplateException("JSON error: " + msg), message_(msg) {}

    const std::string &message() const { return message_ ; }

private:
    std::string message_ ;
};

class IoError: public TemplateException {
public:
    IoError(const std::string &msg): TemplateException("IO error: " + msg), message_(msg) {}

    const std::string &message() const { return message_ ; }

private:
    std::string message_ ;
};

// error raised by user supplied functions, with an optional code for programmatic handling

class CustomError: public TemplateException {
public:
    CustomError(const std::string &msg, const std::string &code = std::string()):
        TemplateException("Custom error: " + msg), message_(msg), code_(code) {}

    const std::string &message() const { return message_ ; }
    const std::string &code() const { return code_ ; }

private:
    std::string message_, code_ ;
};

}

#endif
