#include "build/cache_key.hpp"

#include "util/digest.hpp"

#include <cctype>

std::string make_cache_key(const std::string& revision, const std::vector<std::string>& flags,
                           const std::string& platform) {
    // NUL separators keep ("a b", "c") and ("a", "b c") apart.
    std::string material = revision;
    material.push_back('\0');
    for (const auto& f : flags) {
        material += f;
        material.push_back('\0');
    }
    material += platform;

    std::string prefix;
    for (char c : revision.substr(0, 40)) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_';
        prefix.push_back(keep ? c : '_');
    }
    if (prefix.empty()) prefix = "rev";

    return prefix + "-" + digest::sha1_hex(material).substr(0, 16);
}
