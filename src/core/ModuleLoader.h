#pragma once
#include "Module.h"
#include <string>

namespace hostdiag {

// Builds a Module from a YAML module document. The document tag is ignored;
// every value is taken as a string. Throws ModulePathError when the file cannot
// be read, ModuleParseError for malformed YAML or metadata, and the other
// ModuleError subclasses from Module's own validation.
ModulePtr load_module_file(const std::string& path);
ModulePtr load_module_document(const std::string& document, const std::string& path = "");

}
