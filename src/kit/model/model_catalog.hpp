#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct CatalogEntry {
    std::string name;
    std::string url;
    uint64_t size = 0;  // exact byte count, 0 when not pinned
    std::string sha1;   // empty when not pinned
};

class ModelCatalog {
public:
    explicit ModelCatalog(std::vector<CatalogEntry> entries);

    // The ggml models published alongside whisper.cpp, served from base_url.
    static ModelCatalog whisper_cpp(const std::string& base_url);

    const CatalogEntry* find(const std::string& name) const;
    std::vector<std::string> names() const;
    const std::vector<CatalogEntry>& entries() const { return entries_; }

    // Canonical local file name for a catalog entry.
    static std::string file_name(const std::string& name) { return "ggml-" + name + ".bin"; }

private:
    std::vector<CatalogEntry> entries_;
};
