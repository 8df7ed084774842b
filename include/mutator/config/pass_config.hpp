#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/mutation/options.hpp"

namespace mutator::config {

inline constexpr std::string_view kConfigFileName = "mutator.toml";

enum class PlaceholderKind : uint8_t {
  kIdentity,
  kXor,
  kAdd,
};

struct PlaceholderConfig {
  PlaceholderKind kind = PlaceholderKind::kIdentity;
  int32_t operand = 0;
};

struct CryptConfig {
  uint32_t block_size = 16;
};

struct PassConfig {
  mutation::KeyValueMap key_values;
  std::optional<PlaceholderConfig> placeholder;  // [placeholder] section
  std::optional<CryptConfig> crypt;              // [crypt] section
};

// Search for mutator.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a mutator.toml file.
// Returns error Diagnostic on parse errors or invalid fields.
auto LoadConfig(const std::filesystem::path& config_path) -> Result<PassConfig>;

// Parse configuration text. source_name is used in diagnostics only.
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<PassConfig>;

// Build pass options with the stock transforms the config selects. Absent
// sections leave the corresponding transform unset.
auto BuildOptions(const PassConfig& config) -> mutation::MutationOptions;

}  // namespace mutator::config
