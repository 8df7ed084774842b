#include "mutator/config/pass_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/mutation/options.hpp"
#include "mutator/transform/stock.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace mutator::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(std::string_view source, uint32_t line, std::string msg)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          FileLocation{.path = std::string(source), .line = line},
          std::move(msg)));
}

auto LineOf(const toml::node& node) -> uint32_t {
  return static_cast<uint32_t>(node.source().begin.line);
}

// Accepts [INT32_MIN, UINT32_MAX]; stores as 32-bit two's complement so
// keys can be written as unsigned hex.
auto ToInt32(int64_t value) -> std::optional<int32_t> {
  if (value < std::numeric_limits<int32_t>::min() ||
      value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
    return std::nullopt;
  }
  return static_cast<int32_t>(static_cast<uint32_t>(value & 0xFFFFFFFF));
}

auto ReadKeys(const toml::table& keys, std::string_view source)
    -> Result<mutation::KeyValueMap> {
  mutation::KeyValueMap values;
  for (auto&& [name, node] : keys) {
    auto slot = mutation::ParseKeySlot(name.str());
    if (!slot) {
      return ConfigError(
          source, LineOf(node),
          std::format(
              "unknown key '{}' in [keys] (expected KeyI0..KeyI15)",
              name.str()));
    }
    auto raw = node.value<int64_t>();
    if (!node.is_integer() || !raw) {
      return ConfigError(
          source, LineOf(node),
          std::format("keys.{} must be an integer", name.str()));
    }
    auto value = ToInt32(*raw);
    if (!value) {
      return ConfigError(
          source, LineOf(node),
          std::format("keys.{} = {} does not fit in 32 bits", name.str(), *raw));
    }
    values[*slot] = *value;
  }
  return values;
}

auto ReadPlaceholder(const toml::table& section, std::string_view source)
    -> Result<PlaceholderConfig> {
  PlaceholderConfig config;
  auto transform = section["transform"].value<std::string>();
  if (!transform) {
    return ConfigError(
        source, LineOf(section),
        "missing required field 'placeholder.transform'");
  }
  if (*transform == "identity") {
    config.kind = PlaceholderKind::kIdentity;
  } else if (*transform == "xor") {
    config.kind = PlaceholderKind::kXor;
  } else if (*transform == "add") {
    config.kind = PlaceholderKind::kAdd;
  } else {
    return ConfigError(
        source, LineOf(section),
        std::format(
            "unknown placeholder transform '{}', use 'identity', 'xor' or "
            "'add'",
            *transform));
  }

  if (const toml::node* operand = section.get("operand")) {
    auto raw = operand->value<int64_t>();
    auto value = raw ? ToInt32(*raw) : std::nullopt;
    if (!operand->is_integer() || !value) {
      return ConfigError(
          source, LineOf(*operand),
          "placeholder.operand must be a 32-bit integer");
    }
    config.operand = *value;
  } else if (config.kind != PlaceholderKind::kIdentity) {
    return ConfigError(
        source, LineOf(section),
        std::format(
            "placeholder transform '{}' requires 'placeholder.operand'",
            *transform));
  }
  return config;
}

auto ReadCrypt(const toml::table& section, std::string_view source)
    -> Result<CryptConfig> {
  CryptConfig config;
  auto transform = section["transform"].value<std::string>();
  if (!transform) {
    return ConfigError(
        source, LineOf(section), "missing required field 'crypt.transform'");
  }
  if (*transform != "xor") {
    return ConfigError(
        source, LineOf(section),
        std::format("unknown crypt transform '{}', use 'xor'", *transform));
  }

  if (const toml::node* size = section.get("block_size")) {
    auto raw = size->value<int64_t>();
    if (!size->is_integer() || !raw || *raw <= 0 ||
        *raw > std::numeric_limits<uint16_t>::max()) {
      return ConfigError(
          source, LineOf(*size),
          std::format(
              "crypt.block_size must be an integer in 1..{}",
              std::numeric_limits<uint16_t>::max()));
    }
    config.block_size = static_cast<uint32_t>(*raw);
  }
  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<PassConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return ConfigError(
        source_name, static_cast<uint32_t>(e.source().begin.line),
        std::format("failed to parse: {}", e.description()));
  }

  PassConfig config;

  if (auto* keys = tbl["keys"].as_table()) {
    auto values = ReadKeys(*keys, source_name);
    if (!values) {
      return std::unexpected(std::move(values.error()));
    }
    config.key_values = std::move(*values);
  }

  if (auto* section = tbl["placeholder"].as_table()) {
    auto placeholder = ReadPlaceholder(*section, source_name);
    if (!placeholder) {
      return std::unexpected(std::move(placeholder.error()));
    }
    config.placeholder = *placeholder;
  }

  if (auto* section = tbl["crypt"].as_table()) {
    auto crypt = ReadCrypt(*section, source_name);
    if (!crypt) {
      return std::unexpected(std::move(crypt.error()));
    }
    config.crypt = *crypt;
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<PassConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open config '{}'", config_path.string())));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  return ParseConfig(buffer.str(), config_path.string());
}

auto BuildOptions(const PassConfig& config) -> mutation::MutationOptions {
  mutation::MutationOptions options;
  options.key_values = config.key_values;

  if (config.placeholder) {
    switch (config.placeholder->kind) {
      case PlaceholderKind::kIdentity:
        options.placeholder = transform::Identity();
        break;
      case PlaceholderKind::kXor:
        options.placeholder =
            transform::XorConstant(config.placeholder->operand);
        break;
      case PlaceholderKind::kAdd:
        options.placeholder =
            transform::AddConstant(config.placeholder->operand);
        break;
    }
  }

  if (config.crypt) {
    options.crypt = transform::UnrolledXor(config.crypt->block_size);
  }
  return options;
}

}  // namespace mutator::config
