#include "taptik/package.h"

#include "taptik/errors.h"
#include "taptik/log.h"
#include "taptik/serialization.h"

#include <cctype>

namespace taptik {

namespace {
std::string safe_dump(const nlohmann::json& value, int indent = -1) {
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool non_empty_string(const nlohmann::json& context, const char* key) {
  return context.contains(key) && context[key].is_string() &&
         !context[key].get_ref<const std::string&>().empty();
}

bool non_empty_object(const nlohmann::json& context, const char* key) {
  return context.contains(key) && context[key].is_object() && !context[key].empty();
}

void validate_inputs(const CloudMetadata& metadata, const nlohmann::json& context, const PackageOptions& options) {
  if (metadata.title.empty()) {
    throw ValidationError("Invalid metadata: title is required");
  }
  if (!context.is_object() || !non_empty_string(context, "version")) {
    throw ValidationError("Invalid context: version is required");
  }
  if (!non_empty_string(context, "sourceIde")) {
    throw ValidationError("Invalid context: sourceIde is required");
  }
  if (!non_empty_object(context, "content") && !non_empty_object(context, "data")) {
    throw ValidationError("Invalid context: content is required");
  }
  const uint64_t estimated = safe_dump(context).size();
  if (estimated > options.max_package_size) {
    throw PackageSizeError(estimated, options.max_package_size);
  }
}

std::string collapse_whitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

// Returns false when the node should be dropped from its parent.
bool optimize_node(nlohmann::json& node) {
  if (node.is_null()) return false;
  if (node.is_string()) {
    node = collapse_whitespace(node.get<std::string>());
    return !node.get_ref<const std::string&>().empty();
  }
  if (node.is_object()) {
    const bool was_empty = node.empty();
    for (auto it = node.begin(); it != node.end();) {
      if (optimize_node(it.value())) {
        ++it;
      } else {
        it = node.erase(it);
      }
    }
    return was_empty || !node.empty();
  }
  if (node.is_array()) {
    const bool was_empty = node.empty();
    nlohmann::json kept = nlohmann::json::array();
    for (auto& item : node) {
      if (optimize_node(item)) kept.push_back(std::move(item));
    }
    node = std::move(kept);
    return was_empty || !node.empty();
  }
  return true;
}

uint64_t package_size(const TaptikPackage& pkg) {
  nlohmann::json j = to_json(pkg);
  j.erase("size");
  return safe_dump(j).size();
}

TaptikPackage assemble(const CloudMetadata& metadata, nlohmann::json sanitized, const PackageOptions& options) {
  TaptikPackage pkg;
  pkg.metadata = metadata;
  pkg.format = kPackageFormatCurrent;
  pkg.compression = options.compression;
  pkg.checksum = compute_checksum(sanitized, HashAlgorithm::Sha256, pkg.format);
  if (options.include_sha512) {
    pkg.checksum_sha512 = compute_checksum(sanitized, HashAlgorithm::Sha512, pkg.format);
  }
  pkg.manifest = build_manifest(sanitized);
  pkg.sanitized_config = std::move(sanitized);

  pkg.metadata.checksum = pkg.checksum;
  pkg.metadata.component_count.clear();
  for (const auto& [name, stats] : pkg.manifest.components) {
    pkg.metadata.component_count[name] = stats.count;
  }
  if (pkg.metadata.source_ide.empty() && pkg.sanitized_config.contains("sourceIde") &&
      pkg.sanitized_config["sourceIde"].is_string()) {
    pkg.metadata.source_ide = pkg.sanitized_config["sourceIde"].get<std::string>();
  }
  if (pkg.metadata.created_at.empty()) pkg.metadata.created_at = now_iso();
  pkg.metadata.updated_at = pkg.metadata.created_at;
  pkg.size = package_size(pkg);
  pkg.metadata.file_size = pkg.size;
  return pkg;
}

bool serializes(const nlohmann::json& value) {
  try {
    (void)value.dump();
    return true;
  } catch (const nlohmann::json::exception&) {
    return false;
  }
}

nlohmann::json salvage_section(const nlohmann::json& section) {
  nlohmann::json out = nlohmann::json::object();
  for (auto it = section.begin(); it != section.end(); ++it) {
    if (serializes(it.value())) {
      out[it.key()] = it.value();
    } else {
      log::warn("dropping unserializable section: " + it.key());
    }
  }
  return out;
}

TaptikPackage build_partial(const CloudMetadata& metadata, const nlohmann::json& context,
                            const PackageOptions& options, const std::string& reason) {
  nlohmann::json salvage = nlohmann::json::object();
  for (auto it = context.begin(); it != context.end(); ++it) {
    const auto& value = it.value();
    if ((it.key() == "content" || it.key() == "data") && value.is_object()) {
      salvage[it.key()] = salvage_section(value);
    } else if (serializes(value)) {
      salvage[it.key()] = value;
    }
  }
  CloudMetadata partial_meta = metadata;
  partial_meta.description = "Partial package: " + reason;
  PackageOptions partial_options = options;
  partial_options.include_sha512 = false;
  return assemble(partial_meta, std::move(salvage), partial_options);
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto& v : j[key]) {
    if (v.is_string()) out.push_back(v.get<std::string>());
  }
  return out;
}
} // namespace

PackageOptions package_options_from(const PackageConfig& config) {
  PackageOptions options;
  options.compression = config.compression;
  options.optimize_size = config.optimize_size;
  options.validate_integrity = config.validate_integrity;
  options.include_sha512 = config.include_sha512;
  options.max_package_size = config.max_package_size;
  return options;
}

bool is_supported_format(const std::string& format) {
  return format == kPackageFormatV1 || format == kPackageFormatV2;
}

nlohmann::json optimize_context(const nlohmann::json& context) {
  nlohmann::json copy = context;
  if (!optimize_node(copy)) {
    return nlohmann::json::object();
  }
  return copy;
}

TaptikPackage create_package(const CloudMetadata& metadata, const nlohmann::json& context,
                             const PackageOptions& options) {
  log::info("Creating Taptik package");
  validate_inputs(metadata, context, options);

  TaptikPackage pkg;
  try {
    nlohmann::json sanitized = options.optimize_size ? optimize_context(context) : context;
    pkg = assemble(metadata, std::move(sanitized), options);
  } catch (const ValidationError&) {
    throw;
  } catch (const IntegrityError&) {
    throw;
  } catch (const std::exception& e) {
    log::warn(std::string("Package creation failed, building partial package: ") + e.what());
    return build_partial(metadata, context, options, e.what());
  }

  if (options.validate_integrity && !validate_package_integrity(pkg)) {
    throw IntegrityError("Package integrity validation failed",
                         {"Rebuild the package from the original context"});
  }

  log::info("Package created with size: " + std::to_string(pkg.size) + " bytes");
  return pkg;
}

bool validate_package_integrity(const TaptikPackage& pkg) {
  if (!is_supported_format(pkg.format)) {
    log::warn("Unsupported package format: " + pkg.format);
    return false;
  }
  try {
    if (compute_checksum(pkg.sanitized_config, HashAlgorithm::Sha256, pkg.format) != pkg.checksum) {
      log::warn("Checksum mismatch detected");
      return false;
    }
    if (pkg.checksum_sha512 &&
        compute_checksum(pkg.sanitized_config, HashAlgorithm::Sha512, pkg.format) != *pkg.checksum_sha512) {
      log::warn("SHA-512 checksum mismatch detected");
      return false;
    }
    if (!manifests_equal(build_manifest(pkg.sanitized_config), pkg.manifest)) {
      log::warn("Manifest mismatch detected");
      return false;
    }
  } catch (const Error& e) {
    log::error(std::string("Error validating package integrity: ") + e.what());
    return false;
  }
  return true;
}

nlohmann::json to_json(const CloudMetadata& metadata) {
  nlohmann::json j = {{"title", metadata.title},
                      {"description", metadata.description},
                      {"tags", metadata.tags},
                      {"version", metadata.version},
                      {"createdAt", metadata.created_at},
                      {"updatedAt", metadata.updated_at},
                      {"sourceIde", metadata.source_ide},
                      {"targetIdes", metadata.target_ides},
                      {"complexityLevel", metadata.complexity_level},
                      {"componentCount", metadata.component_count},
                      {"checksum", metadata.checksum},
                      {"fileSize", metadata.file_size},
                      {"isPublic", metadata.is_public}};
  if (!metadata.author.empty()) j["author"] = metadata.author;
  return j;
}

CloudMetadata cloud_metadata_from_json(const nlohmann::json& j) {
  CloudMetadata m;
  if (!j.is_object()) return m;
  m.title = j.value("title", std::string());
  m.description = j.value("description", std::string());
  m.tags = string_list(j, "tags");
  m.author = j.value("author", std::string());
  m.version = j.value("version", m.version);
  m.created_at = j.value("createdAt", std::string());
  m.updated_at = j.value("updatedAt", std::string());
  m.source_ide = j.value("sourceIde", std::string());
  m.target_ides = string_list(j, "targetIdes");
  m.complexity_level = j.value("complexityLevel", m.complexity_level);
  if (j.contains("componentCount") && j["componentCount"].is_object()) {
    for (auto it = j["componentCount"].begin(); it != j["componentCount"].end(); ++it) {
      if (it.value().is_number_unsigned()) m.component_count[it.key()] = it.value().get<size_t>();
    }
  }
  m.checksum = j.value("checksum", std::string());
  m.file_size = j.value("fileSize", static_cast<uint64_t>(0));
  m.is_public = j.value("isPublic", false);
  return m;
}

nlohmann::json to_json(const TaptikPackage& pkg) {
  nlohmann::json j = {{"metadata", to_json(pkg.metadata)},
                      {"sanitizedConfig", pkg.sanitized_config},
                      {"checksum", pkg.checksum},
                      {"format", pkg.format},
                      {"compression", to_string(pkg.compression)},
                      {"manifest", to_json(pkg.manifest)},
                      {"size", pkg.size}};
  if (pkg.checksum_sha512) j["checksumSha512"] = *pkg.checksum_sha512;
  return j;
}

TaptikPackage package_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("format") || !j["format"].is_string() || !j.contains("checksum") ||
      !j.contains("sanitizedConfig")) {
    throw ValidationError("Invalid package format");
  }
  TaptikPackage pkg;
  pkg.format = j["format"].get<std::string>();
  if (!is_supported_format(pkg.format)) {
    throw ValidationError("Invalid package format", {"Supported formats: taptik-v1, taptik-v2"});
  }
  pkg.metadata = cloud_metadata_from_json(j.value("metadata", nlohmann::json::object()));
  pkg.sanitized_config = j["sanitizedConfig"];
  pkg.checksum = j["checksum"].is_string() ? j["checksum"].get<std::string>() : std::string();
  if (j.contains("checksumSha512") && j["checksumSha512"].is_string()) {
    pkg.checksum_sha512 = j["checksumSha512"].get<std::string>();
  }
  pkg.compression = compression_from_string(j.value("compression", std::string("none")));
  pkg.manifest = manifest_from_json(j.value("manifest", nlohmann::json::object()));
  pkg.size = j.value("size", static_cast<uint64_t>(0));
  return pkg;
}

std::string serialize_package(const TaptikPackage& pkg) {
  return compress(to_json(pkg).dump(2), pkg.compression);
}

TaptikPackage deserialize_package(const std::string& bytes) {
  std::string text;
  try {
    text = decompress(bytes);
  } catch (const CompressionError& e) {
    log::warn(std::string("package is not readable: ") + e.what());
    throw ValidationError("Invalid package format");
  }
  const nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    throw ValidationError("Invalid package format");
  }
  TaptikPackage pkg = package_from_json(doc);
  if (!validate_package_integrity(pkg)) {
    throw IntegrityError("Package integrity check failed: checksum or manifest mismatch",
                         {"Download or copy the package again", "Rebuild the package from its source context"});
  }
  return pkg;
}

void write_package(const TaptikPackage& pkg, const std::filesystem::path& path) {
  if (path.empty()) {
    throw ValidationError("Invalid file path");
  }
  log::info("Writing package to: " + path.string());
  write_file_atomic(path, serialize_package(pkg));
  log::info("Package written successfully: " + path.string());
}

TaptikPackage read_package(const std::filesystem::path& path) {
  log::info("Reading package from: " + path.string());
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw NotFoundError("File not found");
  }
  return deserialize_package(read_file_or_throw(path));
}

ChunkedPackage create_chunked_package(const TaptikPackage& pkg, size_t chunk_size) {
  return split_chunks(serialize_package(pkg), chunk_size);
}

TaptikPackage package_from_chunks(const ChunkedPackage& chunked) {
  return deserialize_package(reassemble_chunks(chunked));
}

std::string compress_package(const TaptikPackage& pkg, CompressionCache& cache) {
  return cache.compress(to_json(pkg).dump(2), pkg.compression);
}

} // namespace taptik
