#pragma once
#include <string>
#include <vector>
#include <optional>

namespace hostdiag {
namespace utils {

// Read file line by line; missing file yields empty vector.
std::vector<std::string> read_lines(const std::string& path);
std::optional<std::string> read_file(const std::string& path, size_t max_bytes = 16 * 1024 * 1024);

std::string trim(const std::string& s);
std::string rtrim(const std::string& s);
std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Whitespace split, empty tokens dropped.
std::vector<std::string> split_ws(const std::string& s);
// Split on a single separator, empty tokens dropped.
std::vector<std::string> split_csv(const std::string& s, char sep = ',');
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Lowercase hex SHA-256 of an in-memory buffer (OpenSSL EVP).
std::string sha256_hex(const std::string& data);

// UTC "YYYY-MM-DDTHH:MM:SS.ffffff" with ':' replaced by '_' so it is usable as a directory name.
std::string run_timestamp();

} // namespace utils
} // namespace hostdiag
