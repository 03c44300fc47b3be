#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace cacheq::config {

namespace {

using cacheq::runtime::config::RuntimeConfig;

std::string Where(const YAML::Node& node) {
  const auto mark = node.Mark();
  return "line " + std::to_string(mark.line + 1) + ", column " + std::to_string(mark.column + 1);
}

// Plain scalars become bool / number / string; quoted ones always stay strings.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const auto& text = node.Scalar();

  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  if (!text.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void Convert(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) {
        Convert(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto& fields = *out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: mapping keys must be scalars (" + Where(entry.first) + ")");
        }
        Convert(entry.second, &fields[entry.first.Scalar()]);
      }
      return;
    }

    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node (" + Where(node) + ")");
  }
}

RuntimeConfig ParseJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  auto          status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  // an empty file keeps every default
  if (root.IsNull()) {
    return RuntimeConfig{};
  }
  if (!root.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
  }

  google::protobuf::Value tree;
  Convert(root, &tree);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(tree, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  auto config = ParseJson(json);
  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.cache().has_redis()) {
    const auto& address = config.cache().redis().address();
    if (address.empty()) {
      throw std::runtime_error("Invalid configuration: cache.redis.address is required");
    }
    if (address.find(':') == std::string::npos) {
      throw std::runtime_error("Invalid configuration: cache.redis.address must be host:port, got \"" + address + "\"");
    }
  }

  for (const auto& stream : config.worker().streams()) {
    if (stream.empty()) {
      throw std::runtime_error("Invalid configuration: worker.streams entries must not be empty");
    }
  }
}

} // namespace cacheq::config
