#pragma once
#include "Module.h"
#include <map>
#include <string>
#include <vector>

namespace hostdiag {

// Ordered set of modules, unique by name, with lookup indices by class, domain,
// language, software, package and name. Empty index buckets are removed.
class ModuleRegistry {
public:
    using Index = std::map<std::string, std::vector<ModulePtr>>;

    ModuleRegistry() = default;

    // Loads every non-hidden *.yaml file of `dir` in lexical order. Files that fail
    // to parse or validate, or duplicate a loaded name, are logged and skipped.
    // Returns the number of modules added. Throws RegistryError if `dir` is unreadable.
    size_t load(const std::string& dir);

    void append(ModulePtr mod);
    void insert(size_t index, ModulePtr mod);
    void remove(const Module& mod);
    // List-style bulk operations are not supported.
    [[noreturn]] void extend(const std::vector<ModulePtr>&);
    [[noreturn]] ModulePtr pop();

    ModulePtr find(const std::string& name) const;
    bool contains(const std::string& name) const { return name_map_.count(name) != 0; }

    const std::vector<ModulePtr>& modules() const { return modules_; }
    std::vector<ModulePtr>::const_iterator begin() const { return modules_.begin(); }
    std::vector<ModulePtr>::const_iterator end() const { return modules_.end(); }
    size_t size() const { return modules_.size(); }
    bool empty() const { return modules_.empty(); }
    const ModulePtr& operator[](size_t i) const { return modules_[i]; }

    const Index& class_map() const { return class_map_; }
    const Index& domain_map() const { return domain_map_; }
    const Index& language_map() const { return language_map_; }
    const Index& software_map() const { return software_map_; }
    const Index& package_map() const { return package_map_; }
    const std::map<std::string, ModulePtr>& name_map() const { return name_map_; }

    std::vector<std::string> classes() const;
    std::vector<std::string> domains() const;

    // Stable sort by each module's first class value.
    void sort_by_first_class();

    const std::string& directory() const { return directory_; }

private:
    void check_insertable(const ModulePtr& mod) const;
    void map_module(const ModulePtr& mod);
    void unmap_module(const ModulePtr& mod);

    std::string directory_;
    std::vector<ModulePtr> modules_;
    Index class_map_, domain_map_, language_map_, software_map_, package_map_;
    std::map<std::string, ModulePtr> name_map_;
};

}
