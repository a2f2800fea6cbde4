#include "taptik/checksum.h"

#include "taptik/errors.h"

#include <unordered_set>

namespace taptik {

namespace {
nlohmann::json canonical_node(const nlohmann::json& value, std::unordered_set<const nlohmann::json*>& seen) {
  if (!value.is_structured()) {
    return value;
  }
  if (!seen.insert(&value).second) {
    return "[Circular]";
  }
  nlohmann::json out;
  if (value.is_object()) {
    out = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      out[it.key()] = canonical_node(it.value(), seen);
    }
  } else {
    out = nlohmann::json::array();
    for (const auto& item : value) {
      out.push_back(canonical_node(item, seen));
    }
  }
  seen.erase(&value);
  return out;
}
} // namespace

nlohmann::json canonicalize(const nlohmann::json& value) {
  std::unordered_set<const nlohmann::json*> seen;
  return canonical_node(value, seen);
}

std::string compute_checksum(const nlohmann::json& value, HashAlgorithm algorithm,
                             const std::string& format_version) {
  std::string text;
  try {
    text = canonicalize(value).dump();
  } catch (const nlohmann::json::exception& e) {
    throw ChecksumError(std::string("Failed to calculate checksum: ") + e.what());
  }
  Hasher hasher(algorithm);
  hasher.update(text);
  hasher.update(format_version);
  return hasher.final_hex();
}

} // namespace taptik
