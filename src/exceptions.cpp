#include <nebula/exceptions.hpp>

#include <sstream>

using namespace std ;

namespace nebula {

static string position_message(const string &msg, size_t position) {
    ostringstream strm ;
    strm << "Parse error at position " << position << ": " << msg ;
    return strm.str() ;
}

ParseError::ParseError(const string &msg, size_t position, const string &tmpl):
    TemplateException(position_message(msg, position)),
    message_(msg), position_(position), template_(tmpl) {
}

EvaluationError::EvaluationError(const string &msg, const string &context):
    TemplateException("Evaluation error: " + msg), message_(msg), context_(context) {
}

FunctionError::FunctionError(const string &function, const string &msg, const vector<string> &args):
    TemplateException("Function '" + function + "' failed: " + msg),
    function_(function), message_(msg), args_(args) {
}

TypeError::TypeError(const string &from, const string &to, const string &context):
    TemplateException("Type error: cannot convert " + from + " to " + to),
    from_(from), to_(to), context_(context) {
}

DataNotFound::DataNotFound(const string &path, const vector<string> &available):
    TemplateException("Data not found: " + path), path_(path), available_(available) {
}

SignatureError::SignatureError(const string &function, const string &msg):
    TemplateException("Invalid function signature for '" + function + "': " + msg),
    function_(function), message_(msg) {
}

MathError::MathError(const string &msg): TemplateException("Math error: " + msg), message_(msg) {
}

static string index_message(int64_t index, size_t size) {
    ostringstream strm ;
    strm << "Index " << index << " out of bounds for collection of size " << size ;
    return strm.str() ;
}

IndexError::IndexError(int64_t index, size_t size):
    TemplateException(index_message(index, size)), index_(index), size_(size) {
}

}
