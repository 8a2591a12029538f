#include "core/Module.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string output(reinterpret_cast<const char*>(data), size);
    hostdiag::ParsedOutput parsed = hostdiag::parse_module_output(output);
    if (parsed.verdict == hostdiag::Verdict::None) __builtin_trap();
    return 0;
}
