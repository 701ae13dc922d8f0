#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "common/models.hpp"

namespace histscrub {

class CacheSweeper {
public:
    // Removes every regular file below `dir`, leaving directories in place.
    // A missing directory yields an empty result.
    CacheSweepResult sweep(const std::filesystem::path &dir) const;
};

// Binary units with two decimals, e.g. 1536 -> "1.50 KB". A value switches
// unit only once it exceeds 1024 of the smaller one.
std::string formatBytes(uint64_t bytes);

} // namespace histscrub
