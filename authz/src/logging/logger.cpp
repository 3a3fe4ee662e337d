#include "logging/logger.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

namespace authz::logging {

    std::optional<Level> levelFromString(std::string_view name) {
        std::string upper;
        upper.reserve(name.size());
        for(char c : name) {
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        if(upper == "TRACE") {
            return Level::Trace;
        }
        if(upper == "DEBUG") {
            return Level::Debug;
        }
        if(upper == "INFO") {
            return Level::Info;
        }
        if(upper == "WARN" || upper == "WARNING") {
            return Level::Warn;
        }
        if(upper == "ERROR") {
            return Level::Error;
        }
        if(upper == "NONE" || upper == "OFF") {
            return Level::None;
        }
        return {};
    }

    std::string_view levelName(Level level) {
        switch(level) {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            case Level::None:
                return "NONE";
        }
        return "UNKNOWN";
    }

    std::optional<Format> formatFromString(std::string_view name) {
        if(name == "TEXT" || name == "text") {
            return Format::Text;
        }
        if(name == "JSON" || name == "json") {
            return Format::Json;
        }
        return {};
    }

    static std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        auto secs = std::chrono::system_clock::to_time_t(tp);
        auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count()
            % 1000;
        std::tm utc{};
        gmtime_r(&secs, &utc);
        std::ostringstream stream;
        stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
               << std::setw(3) << millis << 'Z';
        return stream.str();
    }

    static std::string currentThreadName() {
        std::ostringstream stream;
        stream << std::this_thread::get_id();
        return stream.str();
    }

    LogManager::LogManager() : _out(&std::cerr) {
    }

    bool LogManager::isEnabled(Level level) const {
        std::unique_lock guard{_mutex};
        return level != Level::None && level >= _level;
    }

    Level LogManager::level() const {
        std::unique_lock guard{_mutex};
        return _level;
    }

    void LogManager::setLevel(Level level) {
        std::unique_lock guard{_mutex};
        _level = level;
    }

    void LogManager::setFormat(Format format) {
        std::unique_lock guard{_mutex};
        _format = format;
    }

    void LogManager::setOutput(std::ostream &out) {
        std::unique_lock guard{_mutex};
        _file.reset();
        _out = &out;
    }

    void LogManager::setOutputFile(const std::filesystem::path &path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::app);
        if(!file->is_open()) {
            throw std::runtime_error("Unable to open log file " + path.string());
        }
        std::unique_lock guard{_mutex};
        _file = std::move(file);
        _out = _file.get();
    }

    void LogManager::setWatch(std::function<void(const LogEntry &)> watch) {
        std::unique_lock guard{_mutex};
        _watch = std::move(watch);
    }

    void LogManager::clearWatch() {
        std::unique_lock guard{_mutex};
        _watch = nullptr;
    }

    void LogManager::publish(const LogEntry &entry) {
        std::unique_lock guard{_mutex};
        if(_watch) {
            _watch(entry);
        }
        if(_format == Format::Json) {
            writeJson(entry);
        } else {
            writeText(entry);
        }
    }

    void LogManager::writeText(const LogEntry &entry) {
        auto &out = *_out;
        out << formatTimestamp(entry.timestamp) << " [" << levelName(entry.level) << "] ("
            << entry.thread << ") " << entry.loggerName << ":";
        if(!entry.event.empty()) {
            out << ' ' << entry.event << '.';
        }
        if(!entry.message.empty()) {
            out << ' ' << entry.message << '.';
        }
        if(!entry.contexts.empty()) {
            out << " {";
            bool first = true;
            for(const auto &[key, value] : entry.contexts) {
                if(!first) {
                    out << ", ";
                }
                first = false;
                out << key << '=' << value;
            }
            out << '}';
        }
        if(!entry.cause.empty()) {
            out << " cause: " << entry.cause;
        }
        out << '\n';
        out.flush();
    }

    void LogManager::writeJson(const LogEntry &entry) {
        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        writer.StartObject();
        writer.Key("thread");
        writer.String(entry.thread.c_str());
        writer.Key("level");
        auto level = levelName(entry.level);
        writer.String(level.data(), static_cast<rapidjson::SizeType>(level.size()));
        writer.Key("eventType");
        writer.String(entry.event.c_str());
        writer.Key("message");
        writer.String(entry.message.c_str());
        writer.Key("contexts");
        writer.StartObject();
        for(const auto &[key, value] : entry.contexts) {
            writer.Key(key.c_str());
            writer.String(value.c_str());
        }
        writer.EndObject();
        writer.Key("loggerName");
        writer.String(entry.loggerName.c_str());
        writer.Key("timestamp");
        writer.Int64(std::chrono::duration_cast<std::chrono::milliseconds>(
                         entry.timestamp.time_since_epoch())
                         .count());
        if(!entry.cause.empty()) {
            writer.Key("cause");
            writer.String(entry.cause.c_str());
        }
        writer.EndObject();
        *_out << buffer.GetString() << '\n';
        _out->flush();
    }

    Event::Event(const Logger &logger, Level level, std::string_view event)
        : _enabled(logger.isEnabled(level)) {
        if(_enabled) {
            _entry.level = level;
            _entry.loggerName = logger.name();
            _entry.event = event;
        }
    }

    void Event::log(std::string_view message) {
        if(!_enabled) {
            return;
        }
        _entry.timestamp = std::chrono::system_clock::now();
        _entry.thread = currentThreadName();
        _entry.message = message;
        LogManager::get().publish(_entry);
    }

} // namespace authz::logging
