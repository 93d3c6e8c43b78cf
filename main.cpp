#include <nebula/template.hpp>
#include <nebula/loader.hpp>
#include <nebula/exceptions.hpp>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>

using namespace std ;
using namespace nebula ;

extern char **environ ;

static void usage() {
    cerr << "Usage: nebula-render [options] <template>\n"
            "  -I <dir>          template search folder (repeatable, default \".\")\n"
            "  -c <file>         JSON context document\n"
            "  -s <suffix>       template file suffix (default \".tpl\")\n"
            "  -e                import the process environment into $env\n"
            "  -D KEY=VALUE      set an $env variable\n"
            "  --validate        only check the context against the template dependencies\n"
            "  --deps            print the template dependencies and exit\n"
            "  --debug           trace parsing and rendering to stderr\n"
            "  -h, --help        show this message\n" ;
}

static void print_set(ostream &strm, const char *label, const set<string> &items) {
    strm << label << ":" ;
    for( const string &s: items ) strm << ' ' << s ;
    strm << endl ;
}

static void print_dependencies(ostream &strm, const Dependencies &deps) {
    print_set(strm, "input", deps.input_paths) ;
    print_set(strm, "nodes", deps.node_ids) ;
    print_set(strm, "env", deps.env_vars) ;
    print_set(strm, "functions", deps.functions) ;
    strm << "system: " << ( deps.uses_system ? "yes" : "no" ) << endl ;
    strm << "execution: " << ( deps.uses_execution ? "yes" : "no" ) << endl ;
    strm << "workflow: " << ( deps.uses_workflow ? "yes" : "no" ) << endl ;
}

static void import_environment(Context &ctx) {
    for ( char **env = environ ; env && *env ; ++env ) {
        const char *eq = strchr(*env, '=') ;
        if ( eq == nullptr ) continue ;
        ctx.setEnv(string(*env, eq - *env), string(eq + 1)) ;
    }
}

static void report(const TemplateException &e) {
    cerr << e.what() << endl ;

    if ( const ParseError *pe = dynamic_cast<const ParseError *>(&e) ) {
        // show the offending line with a marker under the error position
        const string &src = pe->templateSource() ;
        size_t pos = std::min(pe->position(), src.length()) ;
        size_t start = src.rfind('\n', pos == 0 ? 0 : pos - 1) ;
        start = ( start == string::npos || start >= pos ) ? 0 : start + 1 ;
        size_t end = src.find('\n', pos) ;
        cerr << "  " << src.substr(start, end == string::npos ? string::npos : end - start) << endl ;
        cerr << "  " << string(pos - start, ' ') << '^' << endl ;
    }
    else if ( const DataNotFound *dn = dynamic_cast<const DataNotFound *>(&e) ) {
        if ( !dn->available().empty() ) {
            cerr << "available:" ;
            for( const string &a: dn->available() ) cerr << ' ' << a ;
            cerr << endl ;
        }
    }
}

int main(int argc, char *argv[]) {

    vector<string> folders ;
    string context_file, suffix(".tpl"), template_name ;
    bool import_env = false, validate_only = false, deps_only = false, debug = false ;
    vector<pair<string, string>> defines ;

    for ( int i = 1 ; i < argc ; i++ ) {
        const char *arg = argv[i] ;

        if ( strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0 ) {
            usage() ;
            return 0 ;
        }
        else if ( strcmp(arg, "-I") == 0 || strcmp(arg, "-c") == 0 ||
                  strcmp(arg, "-s") == 0 || strcmp(arg, "-D") == 0 ) {
            if ( ++i == argc ) {
                cerr << "Missing value for option " << arg << endl ;
                usage() ;
                return 2 ;
            }
            if ( arg[1] == 'I' ) folders.push_back(argv[i]) ;
            else if ( arg[1] == 'c' ) context_file = argv[i] ;
            else if ( arg[1] == 's' ) suffix = argv[i] ;
            else {
                const char *eq = strchr(argv[i], '=') ;
                if ( eq == nullptr || eq == argv[i] ) {
                    cerr << "Invalid definition " << argv[i] << ", expected KEY=VALUE" << endl ;
                    return 2 ;
                }
                defines.emplace_back(string(argv[i], eq - argv[i]), string(eq + 1)) ;
            }
        }
        else if ( strcmp(arg, "-e") == 0 ) import_env = true ;
        else if ( strcmp(arg, "--validate") == 0 ) validate_only = true ;
        else if ( strcmp(arg, "--deps") == 0 ) deps_only = true ;
        else if ( strcmp(arg, "--debug") == 0 ) debug = true ;
        else if ( arg[0] == '-' && arg[1] != 0 ) {
            cerr << "Unexpected argument " << arg << endl ;
            usage() ;
            return 2 ;
        }
        else if ( template_name.empty() ) template_name = arg ;
        else {
            cerr << "Only one template may be given" << endl ;
            return 2 ;
        }
    }

    if ( template_name.empty() ) {
        usage() ;
        return 2 ;
    }

    if ( folders.empty() ) folders.push_back(".") ;

    try {
        auto start = std::chrono::steady_clock::now() ;

        FileSystemTemplateLoader loader(folders, suffix) ;
        Template t = Template::parse(loader.load(template_name)) ;

        if ( debug ) {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start) ;
            clog << "parsed " << template_name << " in " << elapsed.count() << "us, "
                 << t.elements().size() << " elements" << endl ;
            for( const TemplateElement &e: t.elements() ) {
                if ( e.isText() )
                    clog << "  text (" << e.text().length() << " bytes)" << endl ;
                else
                    clog << "  expression at " << e.expression().position() << ": "
                         << e.expression().ast()->toString() << endl ;
            }
            print_dependencies(clog, t.dependencies()) ;
        }

        if ( deps_only ) {
            print_dependencies(cout, t.dependencies()) ;
            return 0 ;
        }

        Context ctx ;

        if ( import_env ) import_environment(ctx) ;

        if ( !context_file.empty() ) {
            ctx.load(Value::fromJSONFile(context_file)) ;
            if ( debug ) clog << "loaded context from " << context_file << endl ;
        }

        for( const auto &d: defines )
            ctx.setEnv(d.first, d.second) ;

        if ( validate_only ) {
            t.validateContext(ctx) ;
            cout << "ok" << endl ;
            return 0 ;
        }

        start = std::chrono::steady_clock::now() ;

        string output = t.render(ctx) ;

        if ( debug ) {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start) ;
            clog << "rendered " << output.length() << " bytes in " << elapsed.count() << "us" << endl ;
        }

        cout << output ;
    }
    catch ( TemplateException &e ) {
        report(e) ;
        return 1 ;
    }

    return 0 ;
}
