#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/amount.hpp"

namespace vesting::runtime::config {
class RuntimeConfig;
}
namespace vesting::util {
class Address;
}

namespace vesting::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField UintField(std::string_view key, std::uint64_t value);

// Ledger values render the way the wire carries them: lowercase 0x hex
// and base-10 token units.
LogField AddressField(std::string_view key, const vesting::util::Address& value);
LogField AmountField(std::string_view key, const vesting::util::Amount& value);

void InitializeLogging(const vesting::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace vesting::observability

#define VESTING_LOG_DEBUG(message, ...) ::vesting::observability::LogDebug((message), ##__VA_ARGS__)
#define VESTING_LOG_INFO(message, ...) ::vesting::observability::LogInfo((message), ##__VA_ARGS__)
#define VESTING_LOG_WARN(message, ...) ::vesting::observability::LogWarn((message), ##__VA_ARGS__)
#define VESTING_LOG_ERROR(message, ...) ::vesting::observability::LogError((message), ##__VA_ARGS__)
