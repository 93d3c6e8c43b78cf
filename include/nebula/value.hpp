#ifndef NEBULA_VALUE_HPP
#define NEBULA_VALUE_HPP

#include <cstdint>
#include <map>
#include <vector>
#include <iostream>
#include <string>

// dynamic value flowing through template expressions
//
// e.g.  Value v(Value::Object{
//                              {"name", "Alice"},
//                              {"scores", Value::Array{ 2, 3.5, "n/a" } }
//                }) ;
//       cout << v.toJSON() << endl ;
namespace nebula {


class Value {

public:

    using Object = std::map<std::string, Value> ;
    using Array = std::vector<Value> ;

    using integer_t = int64_t ;
    using float_t = double ;
    using string_t = std::string ;
    using boolean_t = bool ;

    enum class Type : uint8_t {
        Null, Boolean, Integer, Float, String, Array, Object
    };

    // constructors

    Value(): tag_(Type::Null) {}

    Value(boolean_t v) noexcept : tag_(Type::Boolean) { data_.b_ = v ; }

    Value(int v) noexcept: Value((int64_t)v) {}
    Value(unsigned int v) noexcept: Value((int64_t)v) {}

    Value(int64_t v) noexcept: tag_(Type::Integer) { data_.i_ = v ; }
    Value(uint64_t v) noexcept: tag_(Type::Integer) { data_.i_ = (int64_t)v ; }

    Value(float_t v) noexcept: tag_(Type::Float) { data_.f_ = v ; }

    Value(const char *value): tag_(Type::String) {
        new (&data_.s_) string_t(value) ;
    }

    Value(const string_t& value): tag_(Type::String) {
        new (&data_.s_) string_t(value) ;
    }

    Value(string_t&& value): tag_(Type::String) {
        new (&data_.s_) string_t(std::move(value)) ;
    }

    Value(const Object& value): tag_(Type::Object) {
        new (&data_.o_) Object(value) ;
    }

    Value(Object&& value): tag_(Type::Object) {
        new (&data_.o_) Object(std::move(value)) ;
    }

    Value(const Array& value): tag_(Type::Array) {
        new (&data_.a_) Array(value) ;
    }

    Value(Array&& value): tag_(Type::Array) {
        new (&data_.a_) Array(std::move(value)) ;
    }

    ~Value() {
        destroy() ;
    }

    Value(const Value& other) {
        create(other) ;
    }

    Value &operator=(const Value &other) {
        if ( this != &other ) {
            destroy() ;
            create(other) ;
        }
        return *this ;
    }

    Value(Value&& other) noexcept {
        take(other) ;
    }

    Value &operator=(Value &&other) noexcept {
        if ( this != &other ) {
            destroy() ;
            take(other) ;
        }
        return *this ;
    }

    static const Value &null() {
        static const Value null_value ;
        return null_value ;
    }

    // check value type

    Type type() const { return tag_ ; }

    bool isNull() const { return tag_ == Type::Null ; }
    bool isBool() const { return tag_ == Type::Boolean ; }
    bool isInteger() const { return tag_ == Type::Integer ; }
    bool isFloat() const { return tag_ == Type::Float ; }
    bool isNumber() const { return ( tag_ == Type::Integer ) || ( tag_ == Type::Float ) ; }
    bool isString() const { return tag_ == Type::String ; }
    bool isArray() const { return tag_ == Type::Array ; }
    bool isObject() const { return tag_ == Type::Object ; }

    // null, empty string, empty array or empty object
    bool isEmpty() const ;

    // boolean value of the variant used by conditionals and logical operators
    bool isTruthy() const ;

    // one of "null", "boolean", "integer", "float", "string", "array", "object"
    const char *typeName() const ;

    // Coercions. Each accepts the cross-type conversions documented in value.cpp and
    // throws TypeError naming the source and target type otherwise.

    bool asBool() const ;
    int64_t asInteger() const ;
    double asFloat() const ;
    std::string asString() const ;

    const Array &asArray() const ;
    const Object &asObject() const ;

    // length of string, array or object. Throws TypeError for other types.
    size_t length() const ;

    // Returns the member of an object or the element of an array when key is a non-negative
    // integer. Returns nullptr if the key is not found or this is not a container.
    const Value *get(const std::string &key) const ;

    // Returns a value given a path of the form <key1>[.<key2>. ... <keyN>] or nullptr
    // if any of the keys is missing. An empty path returns this.
    const Value *navigate(const std::string &path) const ;

    // Set an object member or replace an array element. Throws IndexError for an out of
    // bounds array index and TypeError if this is neither an array nor an object.
    void set(const std::string &key, const Value &val) ;

    // append to an array, ignored for other types
    void append(const Value &val) {
        if ( isArray() )
            data_.a_.push_back(val) ;
    }

    bool operator == (const Value &other) const ;
    bool operator != (const Value &other) const { return !(*this == other) ; }

    // JSON encoder
    void toJSON(std::ostream &strm) const ;
    std::string toJSON() const ;

    // Parse JSON string into Value. Throws JsonError on malformed input.
    static Value fromJSONString(const std::string &src) ;
    // Throws IoError if the file cannot be read.
    static Value fromJSONFile(const std::string &path) ;

private:

    void destroy() {
        if ( tag_ == Type::Object ) data_.o_.~Object() ;
        else if ( tag_ == Type::Array ) data_.a_.~Array() ;
        else if ( tag_ == Type::String ) data_.s_.~string_t() ;
        tag_ = Type::Null ;
    }

    void copyScalar(const Value &other) {
        if ( other.tag_ == Type::Boolean ) data_.b_ = other.data_.b_ ;
        else if ( other.tag_ == Type::Integer ) data_.i_ = other.data_.i_ ;
        else if ( other.tag_ == Type::Float ) data_.f_ = other.data_.f_ ;
    }

    // this must be destroyed (or never constructed) before calling create or take

    void create(const Value &other) {
        switch ( other.tag_ ) {
        case Type::Object: new (&data_.o_) Object(other.data_.o_) ; break ;
        case Type::Array: new (&data_.a_) Array(other.data_.a_) ; break ;
        case Type::String: new (&data_.s_) string_t(other.data_.s_) ; break ;
        default: copyScalar(other) ; break ;
        }
        tag_ = other.tag_ ;
    }

    void take(Value &other) {
        switch ( other.tag_ ) {
        case Type::Object: new (&data_.o_) Object(std::move(other.data_.o_)) ; break ;
        case Type::Array: new (&data_.a_) Array(std::move(other.data_.a_)) ; break ;
        case Type::String: new (&data_.s_) string_t(std::move(other.data_.s_)) ; break ;
        default: copyScalar(other) ; break ;
        }
        tag_ = other.tag_ ;
        other.destroy() ;
    }

private:

    // active member selected by tag_
    union Data {
        Data() {}
        ~Data() {}

        boolean_t b_ ;
        integer_t i_ ;
        float_t f_ ;
        string_t s_ ;
        Array a_ ;
        Object o_ ;
    } ;

    Data data_ ;
    Type tag_ ;

};

std::ostream &operator << (std::ostream &strm, const Value &v) ;

}
#endif
