#pragma once
#include <string>
#include <chrono>

namespace hostdiag {
namespace jsonutil {

std::string escape(const std::string& s);
std::string time_to_iso(std::chrono::system_clock::time_point tp);

} // namespace jsonutil
} // namespace hostdiag
