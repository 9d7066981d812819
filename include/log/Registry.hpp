#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace evpn::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> evpn()     { return get("evpn"); }
    static std::shared_ptr<spdlog::logger> crypto()   { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> nm()       { return get("nm"); }
    static std::shared_ptr<spdlog::logger> bus()      { return get("bus"); }
    static std::shared_ptr<spdlog::logger> storage()  { return get("storage"); }

    // Swaps the file sink for a fresh one on the same path, e.g. after logrotate moved it.
    static void reopenMainLog();

    [[nodiscard]] static const std::filesystem::path& mainLogPath() { return main_log_path_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // keep the shared sinks so we can swap them later
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;

    static void replaceSinkEverywhere_(const std::shared_ptr<spdlog::sinks::sink>& old_sink,
                                       const std::shared_ptr<spdlog::sinks::sink>& new_sink);
};

}
