#include <spdlog/spdlog.h>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spal/blueprint/blueprint.hpp>
#include <spal/schema/primitives.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace spal::blueprint {

namespace {

namespace pt = boost::property_tree;

std::optional<spal::schema::script_artifact_t> make_artifact(
    const pt::ptree& validator,
    const std::string& plutus_version,
    const std::string_view title) {
  auto compiled_hex = validator.get_optional<std::string>("compiledCode");
  auto hash_hex = validator.get_optional<std::string>("hash");
  if (!compiled_hex || !hash_hex) {
    spdlog::error("Validator '{}' lacks compiledCode or hash", title);
    return std::nullopt;
  }

  auto compiled_code = spal::schema::try_from_hex(*compiled_hex);
  if (!compiled_code || compiled_code->empty()) {
    spdlog::error("Validator '{}' has malformed compiledCode", title);
    return std::nullopt;
  }
  auto hash = spal::schema::try_from_hex(*hash_hex);
  if (!hash || hash->size() != std::tuple_size_v<spal::schema::script_hash_t>) {
    spdlog::error("Validator '{}' has malformed hash '{}'", title, *hash_hex);
    return std::nullopt;
  }

  auto artifact = spal::schema::script_artifact_t{};
  artifact.title = std::string{title};
  artifact.plutus_version = plutus_version;
  std::copy(std::begin(*hash), std::end(*hash), std::begin(artifact.hash));
  artifact.compiled_code = std::move(*compiled_code);
  return artifact;
}

}  // namespace

std::optional<spal::schema::script_artifact_t> parse(
    std::istream& input,
    const std::string_view title) {
  auto document = pt::ptree{};
  try {
    pt::read_json(input, document);
  } catch (const pt::json_parser_error& e) {
    spdlog::error("Failed parsing blueprint: {}", e.what());
    return std::nullopt;
  }

  auto plutus_version =
      document.get<std::string>("preamble.plutusVersion", "v3");
  auto validators = document.get_child_optional("validators");
  if (!validators) {
    spdlog::error("Blueprint has no validators section");
    return std::nullopt;
  }

  for (const auto& [key, validator] : *validators) {
    static_cast<void>(key);
    if (validator.get<std::string>("title", "") == title) {
      return make_artifact(validator, plutus_version, title);
    }
  }
  spdlog::error("Blueprint has no validator titled '{}'", title);
  return std::nullopt;
}

std::optional<spal::schema::script_artifact_t> load(
    const std::string_view path,
    const std::string_view title) {
  auto file_path = std::filesystem::path{std::string{path}};
  if (!std::filesystem::exists(file_path)) {
    spdlog::error("No blueprint found at '{}'", path);
    return std::nullopt;
  }
  auto input = std::ifstream{file_path};
  if (!input.good()) {
    spdlog::error("Failed opening blueprint '{}'", path);
    return std::nullopt;
  }
  auto artifact = parse(input, title);
  if (artifact) {
    spdlog::info("Loaded validator '{}' ({} bytes) from '{}'", title,
                 artifact->compiled_code.size(), path);
  }
  return artifact;
}

}  // namespace spal::blueprint
