#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>
#include <openssl/evp.h>

namespace hostdiag {
namespace utils {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> out;
    std::ifstream f(path);
    if(!f) return out;
    std::string line;
    while(std::getline(f, line)) out.push_back(line);
    return out;
}

std::optional<std::string> read_file(const std::string& path, size_t max_bytes) {
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::string data;
    char buf[8192];
    while(f && data.size() < max_bytes) {
        f.read(buf, sizeof(buf));
        std::streamsize got = f.gcount();
        if(got <= 0) break;
        data.append(buf, static_cast<size_t>(got));
    }
    if(data.size() > max_bytes) data.resize(max_bytes);
    return data;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if(b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string rtrim(const std::string& s) {
    size_t e = s.find_last_not_of(" \t\r\n\f\v");
    if(e == std::string::npos) return "";
    return s.substr(0, e + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out; std::istringstream is(s); std::string tok;
    while(is >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split_csv(const std::string& s, char sep) {
    std::vector<std::string> out; std::string cur;
    for(char c : s){ if(c == sep){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for(size_t i = 0; i < parts.size(); ++i) {
        if(i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1
        && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
        && EVP_DigestFinal_ex(ctx, md, &mdlen) == 1;
    EVP_MD_CTX_free(ctx);
    if(!ok) throw std::runtime_error("sha256 digest failed");
    static const char* hex = "0123456789abcdef";
    std::string out; out.reserve(mdlen * 2);
    for(unsigned int i = 0; i < mdlen; ++i){ out.push_back(hex[md[i] >> 4]); out.push_back(hex[md[i] & 0xF]); }
    return out;
}

std::string run_timestamp() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    std::tm tm{}; gmtime_r(&t, &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d_%02d_%02d.%06lld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

} // namespace utils
} // namespace hostdiag
