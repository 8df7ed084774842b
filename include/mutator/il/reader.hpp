#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/il/module.hpp"

namespace mutator::il {

// Parse a module from its textual listing.
// source_name is used in diagnostics only.
auto ReadModule(std::string_view text, std::string_view source_name)
    -> Result<Module>;

// Read and parse a listing file.
auto ReadModuleFile(const std::filesystem::path& path) -> Result<Module>;

// Parse a listing integer: decimal or 0x-prefixed hex, optionally negative.
// Values in [INT32_MIN, UINT32_MAX] are accepted and stored as 32-bit two's
// complement. Returns nullopt on malformed or out-of-range input.
auto ParseInt32(std::string_view text) -> std::optional<int32_t>;

}  // namespace mutator::il
