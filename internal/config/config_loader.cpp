#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <charconv>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace buildq::config {

namespace {

using buildq::runtime::config::RuntimeConfig;

// yaml-cpp tags quoted and block scalars with "!", plain ones with "?".
bool IsPlainScalar(const YAML::Node& node) {
  return node.Tag() != "!";
}

void SetScalar(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();
  if (!IsPlainScalar(node)) {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  double number = 0;
  const auto* end = text.data() + text.size();
  if (!text.empty()) {
    const auto [ptr, ec] = std::from_chars(text.data(), end, number);
    if (ec == std::errc() && ptr == end) {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      SetScalar(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.as<std::string>()]);
      }
      return;
    }
  }
  throw std::runtime_error("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
}

void RequireNonNegative(const google::protobuf::Duration& duration, const char* name) {
  if (duration.seconds() < 0 || duration.nanos() < 0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + name + " must not be negative");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value document;
  ToProtoValue(yaml, &document);

  std::string json;
  const auto  to_json = google::protobuf::util::MessageToJsonString(document, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.store().has_sqlite()) {
    const auto& sqlite = config.store().sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("Invalid configuration: store.sqlite.path is required");
    }
    RequireNonNegative(sqlite.poll_interval(), "store.sqlite.poll_interval");
  }

  const auto& queue = config.queue();
  for (unsigned char c : queue.key_prefix()) {
    if (std::isspace(c) || std::iscntrl(c)) {
      throw std::runtime_error("Invalid configuration: queue.key_prefix must not contain whitespace");
    }
  }
  RequireNonNegative(queue.job_retention(), "queue.job_retention");
  RequireNonNegative(queue.callback_retention(), "queue.callback_retention");
  RequireNonNegative(queue.priority_weight(), "queue.priority_weight");
  RequireNonNegative(queue.log_tail_block(), "queue.log_tail_block");
  RequireNonNegative(queue.max_claim_wait(), "queue.max_claim_wait");
  RequireNonNegative(config.observability().metrics_export_interval(), "observability.metrics_export_interval");

  if (!config.logging().level().empty()) {
    try {
      (void)observability::ParseLogLevel(config.logging().level());
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("Invalid configuration: logging.level: " + std::string(e.what()));
    }
  }
}

} // namespace buildq::config
