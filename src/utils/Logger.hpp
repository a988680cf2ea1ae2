#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace uiauto {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    // Adds the daily rotating file sink next to the console sink.
    // logMaxPeriod is the number of daily files kept on disk.
    void initialize(bool fileOutput = true,
                    int logMaxPeriod = 3,
                    bool coloredOutput = true);

    void setLogLevel(Level level);

    void addSink(spdlog::sink_ptr sink);
    void removeSink(const spdlog::sink_ptr& sink);

    std::string getLogDirectory() const;

    void debug(const std::string& message)   { logger->debug(message); }
    void info(const std::string& message)    { logger->info(message); }
    void warning(const std::string& message) { logger->warn(message); }
    void error(const std::string& message)   { logger->error(message); }
    void fatal(const std::string& message)   { logger->critical(message); }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> format, Args&&... args) {
        logger->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> format, Args&&... args) {
        logger->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(spdlog::format_string_t<Args...> format, Args&&... args) {
        logger->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> format, Args&&... args) {
        logger->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(spdlog::format_string_t<Args...> format, Args&&... args) {
        logger->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex;
    Level currentLevel = LOG_INFO;
    bool fileSinkAttached = false;
};

#define UIAUTO_LOG_DEBUG(...) uiauto::Logger::getInstance().debug(__VA_ARGS__)
#define UIAUTO_LOG_INFO(...)  uiauto::Logger::getInstance().info(__VA_ARGS__)
#define UIAUTO_LOG_WARN(...)  uiauto::Logger::getInstance().warning(__VA_ARGS__)
#define UIAUTO_LOG_ERROR(...) uiauto::Logger::getInstance().error(__VA_ARGS__)
#define UIAUTO_LOG_FATAL(...) uiauto::Logger::getInstance().fatal(__VA_ARGS__)

inline void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}
inline void info(const std::string& message) {
    Logger::getInstance().info(message);
}
inline void warning(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void warn(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void error(const std::string& message) {
    Logger::getInstance().error(message);
}
inline void fatal(const std::string& message) {
    Logger::getInstance().fatal(message);
}
template<typename... Args>
inline void debug(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().debug(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void info(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().info(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warning(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warn(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void error(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void fatal(spdlog::format_string_t<Args...> format, Args&&... args) {
    Logger::getInstance().fatal(format, std::forward<Args>(args)...);
}
} // namespace uiauto
