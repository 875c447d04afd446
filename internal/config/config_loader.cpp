#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace codeintel::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("3" is not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

codeintel::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  codeintel::runtime::config::RuntimeConfig config;

  config.mutable_logging()->set_level("info");

  auto* storage = config.mutable_storage();
  storage->set_graph_db_path("./data/graph.sqlite3");
  storage->set_checkpoint_db_path("./data/checkpoints.sqlite3");

  auto* jobs = config.mutable_jobs();
  jobs->set_log_dir("./postimplementation_logs");
  jobs->set_min_meaningful_lines(3);
  jobs->set_max_code_chars(4000);
  jobs->set_exclude_tests(true);
  jobs->set_max_finished_jobs(0);
  jobs->add_source_extensions(".java");

  config.mutable_checkpoints()->set_keep_latest(0);
  return config;
}

void ConfigLoader::ApplyEnvironment(codeintel::runtime::config::RuntimeConfig& config) {
  if (const char* log_dir = std::getenv("CODEINTEL_AUDIT_LOG_DIR")) {
    if (*log_dir != '\0') {
      config.mutable_jobs()->set_log_dir(log_dir);
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

codeintel::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  if (yaml.IsNull()) {
    auto config = Defaults();
    ApplyEnvironment(config);
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  codeintel::runtime::config::RuntimeConfig loaded;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  auto config = Defaults();
  if (loaded.jobs().source_extensions_size() > 0) {
    config.mutable_jobs()->clear_source_extensions();
  }
  config.MergeFrom(loaded);
  ApplyEnvironment(config);
  return config;
}

} // namespace codeintel::config
