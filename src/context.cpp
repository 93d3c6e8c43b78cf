#include <nebula/context.hpp>
#include <nebula/exceptions.hpp>

#include <ctime>

using namespace std ;

namespace nebula {

const char *DataSource::name() const {
    switch ( kind_ ) {
    case Kind::Input: return "$input" ;
    case Kind::Node: return "$node" ;
    case Kind::System: return "$system" ;
    case Kind::Execution: return "$execution" ;
    case Kind::Environment: return "$env" ;
    case Kind::Workflow: return "$workflow" ;
    }
    return "" ;
}

static string node_ref(const string &id) {
    return "$node('" + id + "')" ;
}

static string format_time(const std::tm &tm, const char *fmt) {
    char buf[64] ;
    size_t n = strftime(buf, sizeof(buf), fmt, &tm) ;
    return string(buf, n) ;
}

Context::Context(): Context([]() { return std::chrono::system_clock::now() ; }) {
}

Context::Context(const TimeSource &clock): system_(Value::Object()) {
    initSystemData(clock()) ;
}

void Context::initSystemData(const std::chrono::system_clock::time_point &now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now) ;

    std::tm tm ;
    gmtime_r(&t, &tm) ;

    Value::Object datetime{
        { "now", format_time(tm, "%Y-%m-%dT%H:%M:%S+00:00") },
        { "timestamp", (int64_t)t },
        { "iso", format_time(tm, "%Y-%m-%dT%H:%M:%SZ") },
        { "date", format_time(tm, "%Y-%m-%d") },
        { "time", format_time(tm, "%H:%M:%S") }
    } ;

    system_.set("datetime", datetime) ;
}

void Context::setInput(const Value &data) {
    input_ = data ;
    has_input_ = true ;
}

const Value *Context::getInput() const {
    return has_input_ ? &input_ : nullptr ;
}

void Context::addNodeOutput(const string &node_id, const Value &data) {
    nodes_[node_id] = data ;
}

const Value *Context::getNodeOutput(const string &node_id) const {
    auto it = nodes_.find(node_id) ;
    return ( it == nodes_.end() ) ? nullptr : &it->second ;
}

void Context::setEnv(const string &key, const string &value) {
    env_[key] = value ;
}

const string *Context::getEnv(const string &key) const {
    auto it = env_.find(key) ;
    return ( it == env_.end() ) ? nullptr : &it->second ;
}

void Context::setExecutionData(const string &key, const Value &value) {
    execution_[key] = value ;
}

const Value *Context::getExecutionData(const string &key) const {
    auto it = execution_.find(key) ;
    return ( it == execution_.end() ) ? nullptr : &it->second ;
}

void Context::setWorkflowData(const string &key, const Value &value) {
    workflow_[key] = value ;
}

const Value *Context::getWorkflowData(const string &key) const {
    auto it = workflow_.find(key) ;
    return ( it == workflow_.end() ) ? nullptr : &it->second ;
}

void Context::setSystemData(const string &key, const Value &value) {
    system_.set(key, value) ;
}

// data found inside a root value, either the root itself or a nested member

static const Value *lookup_path(const Value &root, const string &path) {
    if ( path.empty() ) return &root ;
    return root.navigate(path) ;
}

template <class M>
static vector<string> prefixed_keys(const M &m, const string &prefix) {
    vector<string> res ;
    for( const auto &kv: m )
        res.push_back(prefix + kv.first) ;
    return res ;
}

Value Context::resolveDataSource(const DataSource &source, const string &path) const {

    switch ( source.kind() ) {
    case DataSource::Kind::Input: {
        if ( !has_input_ )
            throw DataNotFound("$input", { "No input data available" }) ;

        const Value *v = lookup_path(input_, path) ;
        if ( v == nullptr )
            throw DataNotFound("$input." + path, { "$input" }) ;
        return *v ;
    }
    case DataSource::Kind::Node: {
        const string &id = source.nodeId() ;
        auto it = nodes_.find(id) ;
        if ( it == nodes_.end() ) {
            vector<string> available ;
            for( const auto &kv: nodes_ )
                available.push_back(node_ref(kv.first)) ;
            throw DataNotFound(node_ref(id), available) ;
        }

        const Value *v = lookup_path(it->second, path) ;
        if ( v == nullptr )
            throw DataNotFound(node_ref(id) + "." + path, { node_ref(id) }) ;
        return *v ;
    }
    case DataSource::Kind::System: {
        const Value *v = lookup_path(system_, path) ;
        if ( v == nullptr )
            throw DataNotFound("$system." + path, { "$system.datetime" }) ;
        return *v ;
    }
    case DataSource::Kind::Execution: {
        if ( path.empty() ) return execution_ ;
        auto it = execution_.find(path) ;
        if ( it == execution_.end() )
            throw DataNotFound("$execution." + path, prefixed_keys(execution_, "$execution.")) ;
        return it->second ;
    }
    case DataSource::Kind::Workflow: {
        if ( path.empty() ) return workflow_ ;
        auto it = workflow_.find(path) ;
        if ( it == workflow_.end() )
            throw DataNotFound("$workflow." + path, prefixed_keys(workflow_, "$workflow.")) ;
        return it->second ;
    }
    case DataSource::Kind::Environment: {
        auto it = env_.find(path) ;
        if ( it == env_.end() )
            throw DataNotFound("$env." + path, prefixed_keys(env_, "$env.")) ;
        return Value(it->second) ;
    }
    }

    throw DataNotFound(source.name(), availableDataSources()) ;
}

vector<string> Context::availableDataSources() const {
    vector<string> sources ;

    if ( has_input_ ) sources.push_back("$input") ;

    for( const auto &kv: nodes_ )
        sources.push_back(node_ref(kv.first)) ;

    sources.push_back("$system") ;
    sources.push_back("$execution") ;
    sources.push_back("$workflow") ;

    for( const auto &kv: env_ )
        sources.push_back("$env." + kv.first) ;

    return sources ;
}

bool Context::hasDataSource(const DataSource &source) const {
    switch ( source.kind() ) {
    case DataSource::Kind::Input:
        return has_input_ ;
    case DataSource::Kind::Node:
        return nodes_.count(source.nodeId()) != 0 ;
    case DataSource::Kind::System:
    case DataSource::Kind::Execution:
    case DataSource::Kind::Environment:
    case DataSource::Kind::Workflow:
        return true ;
    }
    return false ;
}

static const Value::Object &member_object(const Value &doc, const char *name) {
    const Value *v = doc.get(name) ;
    if ( !v->isObject() )
        throw TypeError(v->typeName(), "object", string("context member '") + name + "'") ;
    return v->asObject() ;
}

void Context::load(const Value &document) {
    if ( !document.isObject() )
        throw TypeError(document.typeName(), "object", "context document") ;

    if ( const Value *v = document.get("input") )
        setInput(*v) ;

    if ( document.get("nodes") ) {
        for( const auto &kv: member_object(document, "nodes") )
            addNodeOutput(kv.first, kv.second) ;
    }

    if ( document.get("env") ) {
        for( const auto &kv: member_object(document, "env") )
            setEnv(kv.first, kv.second.asString()) ;
    }

    if ( document.get("execution") ) {
        for( const auto &kv: member_object(document, "execution") )
            setExecutionData(kv.first, kv.second) ;
    }

    if ( document.get("workflow") ) {
        for( const auto &kv: member_object(document, "workflow") )
            setWorkflowData(kv.first, kv.second) ;
    }

    if ( document.get("system") ) {
        for( const auto &kv: member_object(document, "system") )
            setSystemData(kv.first, kv.second) ;
    }
}

}
