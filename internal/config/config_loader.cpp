#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/address.hpp"
#include "internal/util/amount.hpp"

namespace vesting::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static bool LooksHex(const std::string& scalar) {
  return scalar.size() > 1 && scalar[0] == '0' && (scalar[1] == 'x' || scalar[1] == 'X');
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the non-specific "!" tag
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!LooksHex(scalar_value)) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (!scalar_value.empty() && endptr && *endptr == '\0') {
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

static util::Address RequireAddress(const std::string& field, const std::string& text) {
  util::Address address;
  try {
    address = util::Address::Parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Invalid configuration: " + field + ": " + e.what());
  }
  if (address.IsZero()) {
    throw std::runtime_error("Invalid configuration: " + field + " must not be the zero address");
  }
  return address;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

vesting::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  vesting::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

void ConfigLoader::Validate(const vesting::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    throw std::runtime_error("Invalid configuration: server.bind_address is required");
  }

  if (config.database().backend_case() == vesting::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    throw std::runtime_error("Invalid configuration: database backend is required");
  }

  if (config.database().has_sqlite() && config.database().sqlite().allocation_path() == config.database().sqlite().vesting_path()) {
    throw std::runtime_error("Invalid configuration: database.sqlite paths must differ per ledger");
  }

  const auto admin  = RequireAddress("ledger.admin_address", config.ledger().admin_address());
  const auto engine = RequireAddress("ledger.engine_address", config.ledger().engine_address());
  if (admin == engine) {
    throw std::runtime_error("Invalid configuration: ledger.engine_address must differ from ledger.admin_address");
  }

  if (!config.ledger().token_max_supply().empty()) {
    try {
      if (util::ParseAmount(config.ledger().token_max_supply()) == 0) {
        throw std::runtime_error("must be positive");
      }
    } catch (const std::exception& e) {
      throw std::runtime_error("Invalid configuration: ledger.token_max_supply: " + std::string(e.what()));
    }
  }
}

} // namespace vesting::config
