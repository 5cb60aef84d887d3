#pragma once

#include "error.hpp"
#include "model/model_catalog.hpp"
#include "model/model_fetcher.hpp"
#include "model/model_spec.hpp"
#include "storage/cache_db.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

struct ModelResolverOptions {
    // Holds downloaded models as ggml-<name>.bin.
    std::filesystem::path root;
    std::chrono::seconds timeout{0};
    bool verbose = false;
};

// Owns models/. Concurrent resolves of one name need no lock: every
// download goes to its own temp file and is renamed into place only after
// it validated, so readers never see a partial model.
class ModelResolver {
public:
    ModelResolver(ModelResolverOptions options, ModelCatalog catalog, ModelFetcher& fetcher,
                  CacheDb& db);

    Result<ModelArtifact> resolve(const ModelSpec& spec, std::stop_token stop = {});

    // The failures resolve() can report without touching the network:
    // empty spec, unknown name, missing or empty explicit file.
    Result<void> check(const ModelSpec& spec) const;

    const ModelCatalog& catalog() const { return catalog_; }
    std::filesystem::path local_path(const std::string& name) const;

private:
    Result<ModelArtifact> resolve_path(const std::string& path);
    Result<ModelArtifact> resolve_name(const std::string& name, std::stop_token stop);
    Result<ModelArtifact> download(const CatalogEntry& entry, std::stop_token stop);

    // The verified SHA-1 (empty when the entry pins none), or why the file
    // cannot be used.
    std::expected<std::string, std::string> verify(const CatalogEntry& entry,
                                                   const std::filesystem::path& path,
                                                   const std::string& source_url);

    std::filesystem::path temp_path(const std::string& name) const;
    void log(const std::string& msg);

    ModelResolverOptions options_;
    ModelCatalog catalog_;
    ModelFetcher& fetcher_;
    CacheDb& db_;
};
