#pragma once

#include <cstdint>
#include <string>
#include <utility>

// Either a catalog name or an explicit file; never both.
struct ModelSpec {
    enum class Kind { Name, Path };

    Kind kind = Kind::Name;
    std::string value;

    static ModelSpec named(std::string name) { return {Kind::Name, std::move(name)}; }
    static ModelSpec at_path(std::string path) { return {Kind::Path, std::move(path)}; }
};

enum class ModelProvenance { Explicit, Cached, Downloaded };

struct ModelArtifact {
    std::string path;
    std::string model_id;  // empty for explicit paths
    uint64_t size = 0;
    std::string sha1;      // empty when unknown
    std::string source_url;
    ModelProvenance provenance = ModelProvenance::Explicit;
};

const char* to_string(ModelProvenance p);
