#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace lieko::config {

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:50051";
constexpr const char* kDefaultStorageRoot = "./data/collections";
constexpr uint32_t    kDefaultWriteTimeoutMs = 30000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

lieko::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  lieko::runtime::config::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsNull()) {
    ApplyDefaults(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(lieko::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* storage = config.mutable_storage();
  if (!storage->has_disk() && !storage->has_ram()) {
    storage->mutable_disk()->set_root_path(kDefaultStorageRoot);
  } else if (storage->has_disk() && storage->disk().root_path().empty()) {
    storage->mutable_disk()->set_root_path(kDefaultStorageRoot);
  }

  auto* database = config.mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    database->mutable_memory();
  }

  if (!config.has_locks()) {
    config.mutable_locks()->set_write_timeout_ms(kDefaultWriteTimeoutMs);
  }

  if (const char* admin_key = std::getenv("LIEKO_ADMIN_KEY")) {
    config.mutable_auth()->set_admin_key(admin_key);
  }
}

} // namespace lieko::config
