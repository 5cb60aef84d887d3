#include "model/model_catalog.hpp"

#include <algorithm>
#include <cstdint>

ModelCatalog::ModelCatalog(std::vector<CatalogEntry> entries)
    : entries_(std::move(entries)) {}

ModelCatalog ModelCatalog::whisper_cpp(const std::string& base_url) {
    // Byte sizes and SHA-1 values of the published ggml files.
    struct Published {
        const char* name;
        uint64_t size;
        const char* sha1;
    };
    static const Published models[] = {
        {"tiny", 77691713, "bd577a113a864445d4c299885e0cb97d4ba92b5f"},
        {"tiny.en", 77704715, "c78c86eb1a8faa21b369bcd33207cc90d64ae9df"},
        {"base", 147951465, "465707469ff3a37a2b9b8d8f89f2f99de7299dac"},
        {"base.en", 147964211, "137c40403d78fd54d454da0f9bd998f78703390c"},
        {"small", 487601967, "55356645c2b361a969dfd0ef2c5a50d530afd8d5"},
        {"small.en", 487614201, "db8a495a91d927739e50b3fc1cc4c6b8f6c2d022"},
        {"medium", 1533763059, "fd9727b6e1217c2f614f9b698455c4ffd82463b4"},
        {"medium.en", 1533774781, "8c30f0e44ce9560643ebd10bbe50cd20eafd3723"},
        {"large-v1", 3094623691, "b1caaf735c4cc1429223d5a74f0f4d0b9b59a299"},
        {"large-v2", 3094623691, "0f4c8e34f21cf1a914c59d8b3ce882345ad349d6"},
        {"large-v2-q5_0", 1080732091, "00e39f2196344e901b3a2bd5814807a769bd1630"},
        {"large-v3", 3095033483, "ad82bf6a9043ceed055076d0fd39f5f186ff8062"},
        {"large-v3-q5_0", 1081140203, "e6e2ed78495d403bef4b7cff42ef4aaadcfea8de"},
        {"large-v3-turbo", 1624555275, "4af2b29d7ec73d781377bfd1758ca957a807e941"},
        {"large-v3-turbo-q5_0", 574041195, "e050f7970618a659205450ad97eb95a18d69c9ee"},
    };

    std::string base = base_url;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::vector<CatalogEntry> entries;
    for (const auto& m : models) {
        entries.push_back({
            .name = m.name,
            .url = base + "/" + file_name(m.name),
            .size = m.size,
            .sha1 = m.sha1,
        });
    }
    return ModelCatalog(std::move(entries));
}

const CatalogEntry* ModelCatalog::find(const std::string& name) const {
    auto it = std::ranges::find(entries_, name, &CatalogEntry::name);
    return it != entries_.end() ? &*it : nullptr;
}

std::vector<std::string> ModelCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
}
