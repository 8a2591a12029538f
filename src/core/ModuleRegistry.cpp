#include "ModuleRegistry.h"
#include "ModuleLoader.h"
#include "Errors.h"
#include "Logging.h"
#include "Utils.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace hostdiag {

namespace {

void index_add(ModuleRegistry::Index& idx, const std::string& key, const ModulePtr& mod) {
    idx[key].push_back(mod);
}

void index_drop(ModuleRegistry::Index& idx, const std::string& key, const ModulePtr& mod) {
    auto it = idx.find(key);
    if(it == idx.end()) return;
    auto& bucket = it->second;
    bucket.erase(std::remove(bucket.begin(), bucket.end(), mod), bucket.end());
    if(bucket.empty()) idx.erase(it);
}

std::vector<std::string> keys_of(const ModuleRegistry::Index& idx) {
    std::vector<std::string> out;
    for(const auto& kv : idx) out.push_back(kv.first);
    return out; // std::map keeps keys sorted
}

} // namespace

size_t ModuleRegistry::load(const std::string& dir) {
    auto& log = Logger::instance();
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if(ec) throw RegistryError("Module directory '" + dir + "' not readable: " + ec.message());
    directory_ = fs::absolute(dir, ec).string();

    std::vector<std::string> files;
    for(const auto& entry : it) {
        std::string fname = entry.path().filename().string();
        if(fname.empty() || fname[0] == '.' || !utils::ends_with(fname, ".yaml")) {
            log.debug("Skipping hidden or non-yaml file " + fname + ".");
            continue;
        }
        files.push_back(entry.path().string());
    }
    std::sort(files.begin(), files.end());

    size_t added = 0;
    for(const auto& file : files) {
        log.debug("Adding file: " + file);
        try {
            append(load_module_file(file));
            ++added;
        } catch(const ModuleError& e) {
            log.warn(std::string(e.what()) + ": continuing with next module");
        } catch(const RegistryDuplicateNameError& e) {
            log.warn(std::string(e.what()) + ": continuing with next module");
        }
    }
    return added;
}

void ModuleRegistry::check_insertable(const ModulePtr& mod) const {
    if(!mod) throw RegistryTypeError("Expected a Module, got null");
    if(name_map_.count(mod->name())) throw RegistryDuplicateNameError("Duplicate module detected: '" + mod->name() + "'");
}

void ModuleRegistry::append(ModulePtr mod) {
    check_insertable(mod);
    modules_.push_back(mod);
    map_module(mod);
}

void ModuleRegistry::insert(size_t index, ModulePtr mod) {
    check_insertable(mod);
    if(index > modules_.size()) index = modules_.size();
    modules_.insert(modules_.begin() + static_cast<std::ptrdiff_t>(index), mod);
    map_module(mod);
}

void ModuleRegistry::remove(const Module& mod) {
    auto it = name_map_.find(mod.name());
    if(it == name_map_.end())
        throw RegistryNotPresentError("Failed to remove '" + mod.name() + "'. Not present in module registry.");
    ModulePtr mapped = it->second;
    unmap_module(mapped);
    modules_.erase(std::remove(modules_.begin(), modules_.end(), mapped), modules_.end());
}

void ModuleRegistry::extend(const std::vector<ModulePtr>&) {
    throw RegistryUnsupportedError("extend is not supported; append modules individually");
}

ModulePtr ModuleRegistry::pop() {
    throw RegistryUnsupportedError("pop is not supported; remove modules by identity");
}

ModulePtr ModuleRegistry::find(const std::string& name) const {
    auto it = name_map_.find(name);
    return it == name_map_.end() ? nullptr : it->second;
}

std::vector<std::string> ModuleRegistry::classes() const { return keys_of(class_map_); }
std::vector<std::string> ModuleRegistry::domains() const { return keys_of(domain_map_); }

void ModuleRegistry::sort_by_first_class() {
    std::stable_sort(modules_.begin(), modules_.end(), [](const ModulePtr& a, const ModulePtr& b){
        return a->constraint().first("class") < b->constraint().first("class");
    });
}

void ModuleRegistry::map_module(const ModulePtr& mod) {
    const Constraint& c = mod->constraint();
    for(const auto& v : c.get("class")) index_add(class_map_, v, mod);
    for(const auto& v : c.get("domain")) index_add(domain_map_, v, mod);
    for(const auto& v : c.get("software")) index_add(software_map_, v, mod);
    for(const auto& v : mod->package()) index_add(package_map_, v, mod);
    index_add(language_map_, to_string(mod->language()), mod);
    name_map_[mod->name()] = mod;
}

void ModuleRegistry::unmap_module(const ModulePtr& mod) {
    const Constraint& c = mod->constraint();
    for(const auto& v : c.get("class")) index_drop(class_map_, v, mod);
    for(const auto& v : c.get("domain")) index_drop(domain_map_, v, mod);
    for(const auto& v : c.get("software")) index_drop(software_map_, v, mod);
    for(const auto& v : mod->package()) index_drop(package_map_, v, mod);
    index_drop(language_map_, to_string(mod->language()), mod);
    name_map_.erase(mod->name());
}

}
