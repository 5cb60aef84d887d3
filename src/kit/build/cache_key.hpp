#pragma once

#include <string>
#include <vector>

// "<revision>-<16 hex>", where the hex part is a digest of the revision,
// the flags (order matters) and the platform triple. The revision prefix
// keeps build directories readable; characters outside [A-Za-z0-9._-]
// become '_'.
std::string make_cache_key(const std::string& revision, const std::vector<std::string>& flags,
                           const std::string& platform);
