#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace authz::logging {

    enum class Level { Trace, Debug, Info, Warn, Error, None };

    enum class Format { Text, Json };

    std::optional<Level> levelFromString(std::string_view name);
    std::string_view levelName(Level level);
    std::optional<Format> formatFromString(std::string_view name);

    /**
     * A single structured log entry, as handed to the LogManager for output.
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        Level level{Level::Info};
        std::string loggerName;
        std::string thread;
        std::string event;
        std::string message;
        std::string cause;
        std::vector<std::pair<std::string, std::string>> contexts;
    };

    /**
     * Process wide sink for log entries. Entries are strictly serialized as they are written
     * out. A watch may be installed to observe entries (used by tests).
     */
    class LogManager {
        mutable std::mutex _mutex;
        Level _level{Level::Info};
        Format _format{Format::Text};
        std::ostream *_out;
        std::unique_ptr<std::ofstream> _file;
        std::function<void(const LogEntry &)> _watch;

        LogManager();

        void writeText(const LogEntry &entry);
        void writeJson(const LogEntry &entry);

    public:
        LogManager(const LogManager &) = delete;
        LogManager(LogManager &&) = delete;
        LogManager &operator=(const LogManager &) = delete;
        LogManager &operator=(LogManager &&) = delete;
        ~LogManager() = default;

        static LogManager &get() {
            static LogManager instance{};
            return instance;
        }

        [[nodiscard]] bool isEnabled(Level level) const;
        [[nodiscard]] Level level() const;
        void setLevel(Level level);
        void setFormat(Format format);
        void setOutput(std::ostream &out);
        void setOutputFile(const std::filesystem::path &path);
        void setWatch(std::function<void(const LogEntry &)> watch);
        void clearWatch();
        void publish(const LogEntry &entry);
    };

    class Logger;

    /**
     * Builder for a single log event. Discarded silently if the level is not enabled.
     */
    class Event {
        bool _enabled;
        LogEntry _entry;

        template<typename T>
        static std::string toString(const T &value) {
            if constexpr(std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr(std::is_convertible_v<const T &, std::string_view>) {
                return std::string(std::string_view(value));
            } else {
                std::ostringstream stream;
                stream << value;
                return stream.str();
            }
        }

    public:
        Event(const Logger &logger, Level level, std::string_view event);

        Event &event(std::string_view event) {
            if(_enabled) {
                _entry.event = event;
            }
            return *this;
        }

        template<typename T>
        Event &kv(std::string_view key, const T &value) {
            if(_enabled) {
                _entry.contexts.emplace_back(std::string(key), toString(value));
            }
            return *this;
        }

        Event &cause(const std::exception &error) {
            if(_enabled) {
                _entry.cause = error.what();
            }
            return *this;
        }

        void log(std::string_view message = {});

        template<typename E>
        [[noreturn]] void logAndThrow(const E &error) {
            static_assert(std::is_base_of_v<std::exception, E>);
            cause(error);
            log(error.what());
            throw error;
        }
    };

    /**
     * Named logger. Typical use:
     *
     *     static const auto LOG = logging::Logger::of("authz.service");
     *     LOG.atInfo("role-assigned").kv("user", user).log("Role assigned");
     */
    class Logger {
        std::string _name;

        explicit Logger(std::string_view name) : _name(name) {
        }

    public:
        static Logger of(std::string_view name) {
            return Logger(name);
        }

        [[nodiscard]] const std::string &name() const noexcept {
            return _name;
        }

        [[nodiscard]] bool isEnabled(Level level) const {
            return LogManager::get().isEnabled(level);
        }

        [[nodiscard]] Event at(Level level, std::string_view event = {}) const {
            return Event(*this, level, event);
        }
        [[nodiscard]] Event atTrace(std::string_view event = {}) const {
            return at(Level::Trace, event);
        }
        [[nodiscard]] Event atDebug(std::string_view event = {}) const {
            return at(Level::Debug, event);
        }
        [[nodiscard]] Event atInfo(std::string_view event = {}) const {
            return at(Level::Info, event);
        }
        [[nodiscard]] Event atWarn(std::string_view event = {}) const {
            return at(Level::Warn, event);
        }
        [[nodiscard]] Event atError(std::string_view event = {}) const {
            return at(Level::Error, event);
        }
    };

} // namespace authz::logging
