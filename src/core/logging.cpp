#include "logging.hpp"

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>

#include "../control/config.hpp"
#include "../http/http.hpp"

namespace wren::logging {

static thread_local quill::Logger* g_current_logger = nullptr;

namespace {

quill::LogLevel to_quill_level(std::string_view level) {
  std::string lower = http::to_lower(level);
  if (lower == "debug") {
    return quill::LogLevel::Debug;
  }
  if (lower == "warning" || lower == "warn") {
    return quill::LogLevel::Warning;
  }
  if (lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

// Random v4 UUID, generated once per thread
std::string generate_base_uuid() {
  std::mt19937_64 rng(std::random_device{}() ^
                      static_cast<uint64_t>(
                          std::chrono::steady_clock::now().time_since_epoch().count()));

  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    uint64_t value = rng();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(value >> (j * 8));
    }
  }

  bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
  bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += fmt::format("{:02x}", bytes[i]);
  }
  return out;
}

bool is_hex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // namespace

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_worker_logger(int worker_id, const control::LogConfig& log_config) {
  std::filesystem::create_directories(log_config.output);

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  std::string log_path = fmt::format("{}/worker_{}.log", log_config.output, worker_id);
  std::string logger_name = fmt::format("wren_worker_{}", worker_id);

  quill::Logger* logger = nullptr;
  if (log_config.format == "json") {
    auto sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger(logger_name, std::move(sink));
  } else {
    auto sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
    logger = quill::Frontend::create_or_get_logger(logger_name, std::move(sink));
  }

  logger->set_log_level(to_quill_level(log_config.level));

  g_current_logger = logger;
  return logger;
}

void shutdown_logging() {
  g_current_logger = nullptr;
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger;
}

void set_current_logger(quill::Logger* logger) {
  g_current_logger = logger;
}

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view uuid) {
  // {uuid}#{counter}, e.g. 550e8400-e29b-41d4-a716-446655440000#42
  size_t hash_pos = uuid.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;
  }

  std::string_view uuid_part = uuid.substr(0, hash_pos);
  std::string_view counter_part = uuid.substr(hash_pos + 1);

  if (uuid_part.length() != 36) {
    return false;
  }

  for (size_t i = 0; i < uuid_part.size(); ++i) {
    bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
    if (dash_position ? uuid_part[i] != '-' : !is_hex(uuid_part[i])) {
      return false;
    }
  }

  // Version nibble and RFC 4122 variant
  if (uuid_part[14] != '4') {
    return false;
  }
  char variant = uuid_part[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' && variant != 'A' &&
      variant != 'B') {
    return false;
  }

  if (counter_part.empty()) {
    return false;
  }
  for (char c : counter_part) {
    if (c < '0' || c > '9') {
      return false;
    }
  }

  return true;
}

}  // namespace wren::logging
