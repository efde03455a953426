#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char *kRootLogger = "gri";
constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;
// Shared by the root and every category logger so a file sink added later
// reaches all of them.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_dist_sink;
spdlog::sink_ptr g_file_sink;
std::string g_file_path;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::async_logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  ensure_thread_pool();
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
}

} // namespace

namespace gri {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLogger);
  if (!logger) {
    g_dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_dist_sink->add_sink(
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger = make_async_logger(kRootLogger, {g_dist_sink});
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  if (file != g_file_path) {
    if (g_file_sink) {
      g_dist_sink->remove_sink(g_file_sink);
      g_file_sink.reset();
    }
    if (!file.empty()) {
      if (rotate_files > 0) {
        g_file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, kRotateBytes, rotate_files);
      } else {
        g_file_sink =
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false);
      }
      g_dist_sink->add_sink(g_file_sink);
    }
    g_file_path = file;
  }
  lock.unlock();
  logger->set_level(level);
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind(std::string(kRootLogger) + ".", 0) == 0) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kRootLogger) + "." + category;
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    default_logger = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto new_logger = make_async_logger(name, sinks);
  new_logger->set_level(default_logger ? default_logger->level()
                                       : spdlog::level::info);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

} // namespace gri
