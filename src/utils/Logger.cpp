#include "Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>

namespace uiauto {

namespace {
constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

spdlog::level::level_enum toSpdlog(Logger::Level level) {
    switch (level) {
        case Logger::LOG_DEBUG: return spdlog::level::debug;
        case Logger::LOG_INFO: return spdlog::level::info;
        case Logger::LOG_WARNING: return spdlog::level::warn;
        case Logger::LOG_ERROR: return spdlog::level::err;
        case Logger::LOG_FATAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// Console only until initialize() is called, so tests never touch the log directory.
Logger::Logger() {
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kPattern);
    logger = std::make_shared<spdlog::logger>("uiauto", console);
    logger->set_level(toSpdlog(currentLevel));
    logger->flush_on(spdlog::level::warn);
}

Logger::~Logger() {
    logger->flush();
}

void Logger::initialize(bool fileOutput, int logMaxPeriod, bool coloredOutput) {
    std::lock_guard<std::mutex> lock(mutex);
    auto& sinks = logger->sinks();

    if (!coloredOutput) {
        auto plain = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        plain->set_pattern(kPattern);
        std::replace_if(sinks.begin(), sinks.end(), [](const spdlog::sink_ptr& sink) {
            return std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sink) != nullptr;
        }, plain);
    }

    if (!fileOutput || fileSinkAttached)
        return;

    std::filesystem::path logDir(getLogDirectory());
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
        logger->warn("Cannot create log directory {}: {}", logDir.string(), ec.message());
        return;
    }

    try {
        auto file = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            (logDir / "uiauto.log").string(), 0, 0, false,
            static_cast<uint16_t>(std::max(logMaxPeriod, 0)));
        file->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        sinks.push_back(file);
        fileSinkAttached = true;
    } catch (const spdlog::spdlog_ex& e) {
        logger->warn("Cannot open log file in {}: {}", logDir.string(), e.what());
    }
}

void Logger::setLogLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
    logger->set_level(toSpdlog(level));
}

void Logger::addSink(spdlog::sink_ptr sink) {
    std::lock_guard<std::mutex> lock(mutex);
    logger->sinks().push_back(std::move(sink));
}

void Logger::removeSink(const spdlog::sink_ptr& sink) {
    std::lock_guard<std::mutex> lock(mutex);
    auto& sinks = logger->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

std::string Logger::getLogDirectory() const {
    std::filesystem::path logDir;
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state) {
        logDir = state;
    } else if (const char* home = std::getenv("HOME")) {
        logDir = std::filesystem::path(home) / ".local/state";
    } else {
        return "./logs";
    }
    return (logDir / "uiauto" / "logs").string();
}

} // namespace uiauto
