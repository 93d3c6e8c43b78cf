#ifndef NEBULA_CONTEXT_HPP
#define NEBULA_CONTEXT_HPP

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nebula/value.hpp>

namespace nebula {

// selector of one of the data channels that an expression may read from

class DataSource {
public:
    enum class Kind { Input, Node, System, Execution, Environment, Workflow } ;

    static DataSource input() { return DataSource(Kind::Input) ; }
    static DataSource node(const std::string &id) { return DataSource(Kind::Node, id) ; }
    static DataSource system() { return DataSource(Kind::System) ; }
    static DataSource execution() { return DataSource(Kind::Execution) ; }
    static DataSource environment() { return DataSource(Kind::Environment) ; }
    static DataSource workflow() { return DataSource(Kind::Workflow) ; }

    Kind kind() const { return kind_ ; }

    // empty unless kind() == Kind::Node
    const std::string &nodeId() const { return node_id_ ; }

    // "$input", "$node", "$system", "$execution", "$env" or "$workflow"
    const char *name() const ;

    bool operator == (const DataSource &other) const {
        return kind_ == other.kind_ && node_id_ == other.node_id_ ;
    }
    bool operator != (const DataSource &other) const { return !(*this == other) ; }

private:
    DataSource(Kind kind, const std::string &id = std::string()): kind_(kind), node_id_(id) {}

    Kind kind_ ;
    std::string node_id_ ;
};

using TimeSource = std::function<std::chrono::system_clock::time_point()> ;

// Runtime data available to an expression. Filled by the caller before rendering
// and only read during evaluation.

class Context {
public:

    // system data is stamped with the current wall clock time
    Context() ;

    // system data is stamped with the time returned by the given clock
    explicit Context(const TimeSource &clock) ;

    void setInput(const Value &data) ;
    // nullptr if no input was set
    const Value *getInput() const ;

    void addNodeOutput(const std::string &node_id, const Value &data) ;
    const Value *getNodeOutput(const std::string &node_id) const ;

    void setEnv(const std::string &key, const std::string &value) ;
    const std::string *getEnv(const std::string &key) const ;

    void setExecutionData(const std::string &key, const Value &value) ;
    const Value *getExecutionData(const std::string &key) const ;

    void setWorkflowData(const std::string &key, const Value &value) ;
    const Value *getWorkflowData(const std::string &key) const ;

    // object holding at least the "datetime" block
    const Value &getSystemData() const { return system_ ; }
    void setSystemData(const std::string &key, const Value &value) ;

    // Returns the value found under path in the given source. An empty path returns the whole
    // source. Throws DataNotFound listing the alternatives if the source or path does not exist.
    Value resolveDataSource(const DataSource &source, const std::string &path) const ;

    // sources that may be referenced, for diagnostics
    std::vector<std::string> availableDataSources() const ;

    bool hasDataSource(const DataSource &source) const ;

    // Fill the context from a document of the form
    //
    // { "input": ..., "nodes": { "<id>": ... }, "env": { "<key>": "<value>" },
    //   "execution": { ... }, "workflow": { ... }, "system": { ... } }
    //
    // All members are optional. Throws TypeError if a member has the wrong type.
    void load(const Value &document) ;

private:

    void initSystemData(const std::chrono::system_clock::time_point &now) ;

    bool has_input_ = false ;
    Value input_ ;
    std::map<std::string, Value> nodes_ ;
    std::map<std::string, std::string> env_ ;
    Value::Object execution_, workflow_ ;
    Value system_ ;
};

}

#endif
