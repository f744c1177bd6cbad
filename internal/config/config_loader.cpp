#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace prdchat::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings ("8080", "true").
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
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

static prdchat::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  prdchat::runtime::config::RuntimeConfig config;

  // An empty document is a valid all-defaults config.
  if (!yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

prdchat::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

prdchat::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(prdchat::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }
  if (config.database().backend_case() == prdchat::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* llm = config.mutable_llm();
  if (llm->request_timeout_ms() == 0) llm->set_request_timeout_ms(kDefaultLlmTimeoutMs);
  if (llm->summarizer_model().empty()) llm->set_summarizer_model(llm->chat_model());

  auto* chat = config.mutable_chat();
  if (chat->max_history_messages() == 0) chat->set_max_history_messages(kDefaultMaxHistoryMessages);
  if (chat->max_citations() == 0) chat->set_max_citations(kDefaultMaxCitations);
  if (chat->broadcast_queue_capacity() == 0) chat->set_broadcast_queue_capacity(kDefaultQueueCapacity);
  if (chat->stream_channel_capacity() == 0) chat->set_stream_channel_capacity(kDefaultQueueCapacity);

  auto* compression = config.mutable_compression();
  if (compression->threshold_chars() <= 0) compression->set_threshold_chars(kDefaultCompressionThresholdChars);
  if (compression->target_keep_chars() <= 0) compression->set_target_keep_chars(kDefaultTargetKeepChars);
  if (compression->min_keep_count() == 0) compression->set_min_keep_count(kDefaultMinKeepCount);
  if (compression->max_wait_ms() == 0) compression->set_max_wait_ms(kDefaultCompressionMaxWaitMs);
  if (compression->worker_threads() == 0) compression->set_worker_threads(kDefaultCompressionWorkers);

  auto* cache = config.mutable_cache();
  if (cache->checkpoint_ttl_sec() == 0) cache->set_checkpoint_ttl_sec(kDefaultCacheTtlSec);
  if (cache->document_ttl_sec() == 0) cache->set_document_ttl_sec(kDefaultCacheTtlSec);
  if (cache->run_retention_sec() == 0) cache->set_run_retention_sec(kDefaultCacheTtlSec);
}

} // namespace prdchat::config
