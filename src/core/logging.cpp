#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>

#include "../control/config.hpp"

namespace conduit::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output == "console") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("conduit_console");
    logger = quill::Frontend::create_or_get_logger("conduit", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/conduit.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("conduit", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("conduit", std::move(file_sink));
    }
  }

  std::string level_lower = log_config.level;
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

  if (level_lower == "debug") {
    logger->set_log_level(quill::LogLevel::Debug);
  } else if (level_lower == "info") {
    logger->set_log_level(quill::LogLevel::Info);
  } else if (level_lower == "warning" || level_lower == "warn") {
    logger->set_log_level(quill::LogLevel::Warning);
  } else if (level_lower == "error") {
    logger->set_log_level(quill::LogLevel::Error);
  } else {
    logger->set_log_level(quill::LogLevel::Info);
  }

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void shutdown_logging() {
  if (auto* logger = g_logger.load(std::memory_order_acquire)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  quill::Logger* logger = g_logger.load(std::memory_order_acquire);
  if (logger) {
    return logger;
  }

  auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("conduit_console");
  logger = quill::Frontend::create_or_get_logger("conduit_fallback", std::move(console_sink));

  quill::Logger* expected = nullptr;
  g_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel);
  return g_logger.load(std::memory_order_acquire);
}

static std::mt19937_64& thread_rng() {
  // XOR combines hardware randomness with timestamp for thread-unique seed
  static thread_local std::mt19937_64 rng(
      (static_cast<uint64_t>(std::random_device{}()) << 32) ^
      static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
  return rng;
}

std::string generate_uuid() {
  std::uniform_int_distribution<uint64_t> dist;
  auto& rng = thread_rng();

  // 128 bits of random data
  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 8) {
    uint64_t random_val = dist(rng);
    for (size_t b = 0; b < 8; ++b) {
      uuid_bytes[i + b] = static_cast<uint8_t>((random_val >> (8 * b)) & 0xFF);
    }
  }

  // Set version to 4 (random UUID)
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  // Set variant to RFC4122
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out += '-';
    }
    out += kHex[uuid_bytes[i] >> 4];
    out += kHex[uuid_bytes[i] & 0x0F];
  }
  return out;
}

std::string generate_correlation_id() {
  // Base UUID once per thread, incrementing counter per request
  static thread_local std::string base_uuid = generate_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

}  // namespace conduit::logging
