#ifndef JCX_DIVAN_LOG_H
#define JCX_DIVAN_LOG_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jcailloux::divan::log {

// =============================================================================
// Log — callback-routed logging for divan
//
// The library never writes to stdout/stderr itself. The application installs
// a callback once at startup and routes messages to its own logger.
//
// Usage:
//   DIVAN_LOG_ERROR << name << ": query error - " << e.what();
//   DIVAN_LOG_INFO  << "Design document " << doc << " does not exist, creating it.";
//   DIVAN_LOG_DEBUG << name << ": read " << key;
//
// Configuration (in application startup):
//   jcailloux::divan::log::setCallback([](Level level, const char* msg, size_t len) {
//       spdlog::info("{}", std::string_view(msg, len));
//   });
// =============================================================================

enum class Level : uint8_t { Debug, Info, Warn, Error };

using Callback = void(*)(Level level, const char* msg, size_t len);

namespace detail {
    inline Callback& ref() noexcept {
        static Callback cb = nullptr;
        return cb;
    }

    inline Level& threshold() noexcept {
        static Level lvl = Level::Debug;
        return lvl;
    }
}  // namespace detail

/// Set the log callback. Pass nullptr to disable logging.
inline void setCallback(Callback cb) noexcept { detail::ref() = cb; }

inline Callback getCallback() noexcept { return detail::ref(); }

/// Messages below this level are dropped before formatting reaches the callback.
inline void setMinLevel(Level level) noexcept { detail::threshold() = level; }

inline Level minLevel() noexcept { return detail::threshold(); }

// =============================================================================
// LogStream — accumulates a message and dispatches it on destruction
// =============================================================================

class LogStream {
public:
    explicit LogStream(Level level) noexcept
        : level_(level)
        , enabled_(getCallback() != nullptr && level >= minLevel()) {}

    ~LogStream() {
        if (!enabled_) return;
        if (auto cb = getCallback()) {
            cb(level_, buf_.data(), buf_.size());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& operator<<(const char* s) {
        if (enabled_ && s) buf_ += s;
        return *this;
    }

    LogStream& operator<<(std::string_view s) {
        if (enabled_) buf_.append(s.data(), s.size());
        return *this;
    }

    LogStream& operator<<(const std::string& s) {
        if (enabled_) buf_ += s;
        return *this;
    }

    LogStream& operator<<(char c) {
        if (enabled_) buf_ += c;
        return *this;
    }

    template<typename T> requires std::integral<T> && (!std::same_as<T, char>) && (!std::same_as<T, bool>)
    LogStream& operator<<(T val) {
        if (enabled_) buf_ += std::to_string(val);
        return *this;
    }

    LogStream& operator<<(bool val) {
        if (enabled_) buf_ += val ? "true" : "false";
        return *this;
    }

private:
    Level level_;
    bool enabled_;
    std::string buf_;
};

}  // namespace jcailloux::divan::log

#define DIVAN_LOG_ERROR ::jcailloux::divan::log::LogStream(::jcailloux::divan::log::Level::Error)
#define DIVAN_LOG_WARN  ::jcailloux::divan::log::LogStream(::jcailloux::divan::log::Level::Warn)
#define DIVAN_LOG_INFO  ::jcailloux::divan::log::LogStream(::jcailloux::divan::log::Level::Info)
#define DIVAN_LOG_DEBUG ::jcailloux::divan::log::LogStream(::jcailloux::divan::log::Level::Debug)

#endif  // JCX_DIVAN_LOG_H
