#include <nebula/loader.hpp>
#include <nebula/exceptions.hpp>

#include <fstream>
#include <sstream>

using namespace std ;

namespace nebula {

FileSystemTemplateLoader::FileSystemTemplateLoader(const vector<string> &root_folders, const string &suffix):
    root_folders_(root_folders), suffix_(suffix) {
}

string FileSystemTemplateLoader::fileName(const string &key) const {
    bool has_suffix = key.length() >= suffix_.length() &&
            key.compare(key.length() - suffix_.length(), suffix_.length(), suffix_) == 0 ;

    return has_suffix ? key : key + suffix_ ;
}

string FileSystemTemplateLoader::load(const string &key) {
    string file_name = fileName(key) ;

    for( const string &folder: root_folders_ ) {
        ifstream strm(folder + '/' + file_name) ;
        if ( !strm ) continue ;

        ostringstream contents ;
        contents << strm.rdbuf() ;
        return contents.str() ;
    }

    throw IoError("Cannot find template: " + key) ;
}

}
