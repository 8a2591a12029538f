#include "ModuleLoader.h"
#include "Errors.h"
#include "Utils.h"
#include <yaml-cpp/yaml.h>

namespace hostdiag {

namespace {

ConstraintValue to_constraint_value(const YAML::Node& node) {
    switch(node.Type()) {
        case YAML::NodeType::Scalar:
            return ConstraintValue(utils::rtrim(node.Scalar()));
        case YAML::NodeType::Sequence: {
            std::vector<ConstraintValue> items;
            for(const auto& item : node) items.push_back(to_constraint_value(item));
            return ConstraintValue::sequence(std::move(items));
        }
        case YAML::NodeType::Map: {
            std::vector<ConstraintValue::Entry> entries;
            for(const auto& kv : node) entries.emplace_back(kv.first.as<std::string>(), to_constraint_value(kv.second));
            return ConstraintValue::mapping(std::move(entries));
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return ConstraintValue();
}

std::string scalar_field(const YAML::Node& doc, const char* key, const std::string& path) {
    YAML::Node n = doc[key];
    if(!n || n.IsNull()) return "";
    if(!n.IsScalar()) throw ModuleParseError("Parsing of module " + path + " failed: '" + key + "' must be a scalar");
    return utils::rtrim(n.Scalar());
}

void read_spec(const YAML::Node& doc, const std::string& path, ModuleSpec& spec) {
    spec.name = scalar_field(doc, "name", path);
    spec.version = scalar_field(doc, "version", path);
    spec.title = scalar_field(doc, "title", path);
    spec.helptext = scalar_field(doc, "helptext", path);
    spec.placement = scalar_field(doc, "placement", path);
    spec.language = scalar_field(doc, "language", path);
    spec.content = scalar_field(doc, "content", path);
    spec.path = path.empty() ? scalar_field(doc, "path", path) : path;

    YAML::Node pkg = doc["package"];
    if(pkg && pkg.IsSequence()) {
        spec.has_package = pkg.size() > 0;
        for(const auto& p : pkg) {
            if(!p.IsScalar()) continue;
            std::string v = utils::trim(p.Scalar());
            if(!v.empty()) spec.package.push_back(v);
        }
    } else if(pkg && pkg.IsScalar()) {
        std::string v = utils::trim(pkg.Scalar());
        spec.has_package = !v.empty();
        if(!v.empty()) spec.package.push_back(v);
    }

    YAML::Node c = doc["constraint"];
    if(c) spec.constraint = to_constraint_value(c);
}

} // namespace

ModulePtr load_module_document(const std::string& document, const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::Load(document);
    } catch(const YAML::Exception& e) {
        throw ModuleParseError("Parsing of module " + path + " failed: " + e.what());
    }
    if(!doc.IsMap()) throw ModuleParseError("Parsing of module " + path + " failed: document is not a mapping");

    ModuleSpec spec;
    try {
        read_spec(doc, path, spec);
    } catch(const YAML::Exception& e) {
        throw ModuleParseError("Parsing of module " + path + " failed: " + e.what());
    }

    try {
        auto mod = std::make_shared<Module>(std::move(spec));
        mod->set_digest(utils::sha256_hex(document));
        return mod;
    } catch(const ConstraintError& e) {
        throw ModuleParseError("Parsing of module " + path + " failed: " + e.what());
    }
}

ModulePtr load_module_file(const std::string& path) {
    auto data = utils::read_file(path);
    if(!data) throw ModulePathError("Invalid Module Path defined: " + path);
    return load_module_document(*data, path);
}

}
