#pragma once

#include "taptik/digest.h"

#include <string>

#include <nlohmann/json.hpp>

namespace taptik {

constexpr const char* kPackageFormatV1 = "taptik-v1";
constexpr const char* kPackageFormatV2 = "taptik-v2";
constexpr const char* kPackageFormatCurrent = kPackageFormatV2;

// Copy with object keys in sorted order. A node reached again within the
// same walk is replaced by the string "[Circular]".
nlohmann::json canonicalize(const nlohmann::json& value);

// Digest of the compact canonical form followed by the package format
// string. Throws ChecksumError when the value cannot be serialized.
std::string compute_checksum(const nlohmann::json& value,
                             HashAlgorithm algorithm = HashAlgorithm::Sha256,
                             const std::string& format_version = kPackageFormatCurrent);

} // namespace taptik
