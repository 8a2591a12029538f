#pragma once
#include <stdexcept>
#include <string>

namespace hostdiag {

class ConstraintError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Module metadata / execution errors.
class ModuleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
class ModuleParseError : public ModuleError { public: using ModuleError::ModuleError; };
class ModuleConstraintKeyError : public ModuleError { public: using ModuleError::ModuleError; };
class ModuleUnknownPlacementError : public ModuleError { public: using ModuleError::ModuleError; };
class ModuleUnsupportedLanguageError : public ModuleError { public: using ModuleError::ModuleError; };
class ModulePathError : public ModuleError { public: using ModuleError::ModuleError; };

// Non-zero exit, timeout or spawn failure. Carries whatever the process printed.
class ModuleRunFailure : public ModuleError {
public:
    ModuleRunFailure(const std::string& msg, std::string output, int exit_code)
        : ModuleError(msg), output_(std::move(output)), exit_code_(exit_code) {}
    const std::string& output() const { return output_; }
    int exit_code() const { return exit_code_; }
private:
    std::string output_;
    int exit_code_;
};

class RegistryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
class RegistryTypeError : public RegistryError { public: using RegistryError::RegistryError; };
class RegistryDuplicateNameError : public RegistryError { public: using RegistryError::RegistryError; };
class RegistryNotPresentError : public RegistryError { public: using RegistryError::RegistryError; };
class RegistryUnsupportedError : public RegistryError { public: using RegistryError::RegistryError; };

class OptionsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RunError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
class PrediagnosticFailure : public RunError { public: using RunError::RunError; };
class RunDirectoryError : public RunError { public: using RunError::RunError; };

}
