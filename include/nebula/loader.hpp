#ifndef NEBULA_TEMPLATE_LOADER_HPP
#define NEBULA_TEMPLATE_LOADER_HPP

#include <string>
#include <vector>

namespace nebula {
// abstract template source loader

class TemplateLoader {
public:
    virtual ~TemplateLoader() = default ;

    // override to return a template string from a key
    virtual std::string load(const std::string &key) =0 ;
};

// loads templates from file system relative to root folders, searched in order

class FileSystemTemplateLoader: public TemplateLoader {

public:
    FileSystemTemplateLoader(const std::vector<std::string> &root_folders, const std::string &suffix = ".tpl") ;

    // Throws IoError if the template is not found in any of the folders
    virtual std::string load(const std::string &key) override ;

    const std::vector<std::string> &rootFolders() const { return root_folders_ ; }
    const std::string &suffix() const { return suffix_ ; }

private:
    // key with the suffix appended unless already present
    std::string fileName(const std::string &key) const ;

    std::vector<std::string> root_folders_ ;
    std::string suffix_ ;
};

}

#endif
