/* @file ConfigLoader.cpp
 * @brief JSON -> BackpackConfig, validated against the chip's address range.
 *
 * © 2025 quadseg contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// quadseg headers
#include "core/ConfigLoader.hpp"

using namespace quadseg::core;
using nlohmann::json;

namespace {

  long parseAddress(const json& value) {
    if (value.is_number_integer())
      return value.get<long>();

    if (value.is_string()) {
      const auto text = value.get<std::string>();
      std::size_t used = 0;
      long parsed = 0;
      try {
        parsed = std::stol(text, &used, 0); // base 0: accepts "0x70" and "112"
      } catch (const std::exception&) {
        throw std::runtime_error("[ConfigLoader] address is not a number: " + text);
      }
      if (used != text.size())
        throw std::runtime_error("[ConfigLoader] trailing characters in address: " + text);
      return parsed;
    }

    throw std::runtime_error("[ConfigLoader] address must be an integer or a string");
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

BackpackConfig ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  std::stringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}

BackpackConfig ConfigLoader::parse(const std::string& text) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("[ConfigLoader] malformed JSON: ") + e.what());
  }

  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] top-level value must be an object");

  BackpackConfig cfg;

  if (auto it = doc.find("bus"); it != doc.end()) {
    if (!it->is_string() || it->get<std::string>().empty())
      throw std::runtime_error("[ConfigLoader] bus must be a non-empty string");
    cfg.bus = it->get<std::string>();
  }

  if (auto it = doc.find("address"); it != doc.end()) {
    const long addr = parseAddress(*it);
    if (addr < 0 || addr > BackpackConfig::kMaxAddress)
      throw std::runtime_error("[ConfigLoader] address out of range 0x00-0x77: " +
                               std::to_string(addr));
    cfg.address = static_cast<std::uint8_t>(addr);
  }

  return cfg;
}
