/**
 * @file event_log.cpp
 * @brief Реализация журнала событий
 */

#include "event_log.hpp"

#include <ctime>
#include <format>
#include <iomanip>
#include <utility>

namespace incmerkle::log {

namespace {

// ANSI коды цветов
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

[[nodiscard]] const char* level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return ansi::RED;
        case LogLevel::Warn:  return ansi::YELLOW;
        case LogLevel::Info:  return ansi::GREEN;
        case LogLevel::Debug: return ansi::DIM;
        default: return ansi::RESET;
    }
}

[[nodiscard]] const char* event_color(EventType type) noexcept {
    switch (type) {
        case EventType::TreeFull:
        case EventType::InvalidState:
        case EventType::StorageError:
            return ansi::RED;
        case EventType::ProofRejected:
            return ansi::YELLOW;
        case EventType::LeafInserted:
        case EventType::RootComputed:
            return ansi::CYAN;
        default:
            return ansi::DIM;
    }
}

} // anonymous namespace

Result<LogLevel> parse_level(std::string_view name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "info")  return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;

    return Err<LogLevel>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестный уровень логирования: '{}'", name)
    );
}

// =============================================================================
// Реализация
// =============================================================================

struct EventLog::Impl {
    EventLogConfig config;
    LogLevel level;
    std::ostream& out;

    std::deque<EventRecord> events;
    mutable std::mutex mutex;

    Impl(const EventLogConfig& cfg, std::ostream& stream)
        : config(cfg)
        , level(parse_level(cfg.level).value_or(LogLevel::Info))
        , out(stream) {}

    void echo(const EventRecord& event) {
        auto time = std::chrono::system_clock::to_time_t(event.timestamp);
        std::tm tm{};
        localtime_r(&time, &tm);

        if (config.color) {
            out << ansi::DIM << std::put_time(&tm, "%H:%M:%S") << ansi::RESET << " "
                << level_color(event.level) << ansi::BOLD
                << "[" << to_string(event.level) << "]" << ansi::RESET << " "
                << event_color(event.type)
                << "[" << to_string(event.type) << "]" << ansi::RESET << " "
                << event.message << "\n";
        } else {
            out << std::put_time(&tm, "%H:%M:%S") << " "
                << "[" << to_string(event.level) << "] "
                << "[" << to_string(event.type) << "] "
                << event.message << "\n";
        }
    }
};

EventLog::EventLog(const EventLogConfig& config, std::ostream& out)
    : impl_(std::make_unique<Impl>(config, out)) {}

EventLog::~EventLog() = default;

bool EventLog::enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) <= static_cast<int>(impl_->level);
}

LogLevel EventLog::level() const noexcept {
    return impl_->level;
}

void EventLog::record(EventType type, LogLevel level, std::string message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    EventRecord record;
    record.type = type;
    record.level = level;
    record.timestamp = std::chrono::system_clock::now();
    record.message = std::move(message);

    if (impl_->config.echo) {
        impl_->echo(record);
    }

    if (impl_->config.event_history == 0) {
        return;
    }
    impl_->events.push_back(std::move(record));

    // Ограничиваем размер истории
    while (impl_->events.size() > impl_->config.event_history) {
        impl_->events.pop_front();
    }
}

std::vector<EventRecord> EventLog::recent(std::size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    std::size_t start = impl_->events.size() > count ? impl_->events.size() - count : 0;
    return std::vector<EventRecord>(impl_->events.begin() + static_cast<std::ptrdiff_t>(start),
                                    impl_->events.end());
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->events.size();
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->events.clear();
}

} // namespace incmerkle::log
