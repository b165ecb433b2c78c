#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

/*! Minimal logger used inside the engine wrapper libraries.
 *
 *  The wrappers are shared libraries that do not link logfault. The application
 *  installs a callback with WhisperEngine::setLogger() and the messages are
 *  forwarded into its own log. Without a callback the messages go to std::clog.
 */

namespace qdc::logfwd {

// Mirrors logfault::LogLevel so values can be cast between the two
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view toName(Level l) {
    static constexpr auto names = std::to_array<std::string_view>({
        "", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

struct Sink {
    std::mutex mutex;
    callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Sink& sink() {
    static Sink s;
    return s;
}

inline void install(callback_t cb, std::string_view tag, Level lvl) {
    auto& s = sink();
    {
        std::lock_guard lock{s.mutex};
        s.tag = tag;
        s.cb = std::move(cb);
    }
    s.level = lvl;
}

inline bool relevant(Level lvl) noexcept {
    return lvl != Level::NONE && lvl <= sink().level.load(std::memory_order_relaxed);
}

class Line {
public:
    Line(Level lvl, SourceLoc loc) : lvl_{lvl}, loc_{loc} {}
    ~Line() { flush(); }

    std::ostream& stream() { return ss_; }

private:
    void flush() noexcept {
        const auto msg = ss_.str();
        if (msg.empty()) {
            return;
        }

        auto& s = sink();
        std::lock_guard lock{s.mutex};
        if (s.cb) {
            s.cb(lvl_, loc_, msg, s.tag);
            return;
        }

        std::clog << std::format("{:%FT%T} [{}] {} {}", std::chrono::system_clock::now(),
                                 toName(lvl_), s.tag, msg) << std::endl;
    }

    const Level lvl_;
    const SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
// Callback for WhisperEngine::setLogger() in code that uses logfault
inline void toLogfault(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag) {
    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file ? loc.file : "", loc.line, loc.func ? loc.func : "").Line()
            << tag << ' ' << msg;
    }
}

inline Level fromLogfault(logfault::LogLevel level) noexcept {
    return static_cast<Level>(level);
}
#endif

} // namespace qdc::logfwd

#if defined(LOGFAULT_FWD_ENABLE_LOGGING) && LOGFAULT_FWD_ENABLE_LOGGING

#if defined(__GNUC__) || defined(__clang__)
#define QDC_LOGFWD_FUNC __PRETTY_FUNCTION__
#else
#define QDC_LOGFWD_FUNC __func__
#endif

#define QDC_LOGFWD(lvl) \
    ::qdc::logfwd::relevant(lvl) && ::qdc::logfwd::Line(lvl, {__FILE__, __LINE__, QDC_LOGFWD_FUNC}).stream()

#define LOG_ERROR  QDC_LOGFWD(::qdc::logfwd::Level::ERROR)
#define LOG_WARN   QDC_LOGFWD(::qdc::logfwd::Level::WARN)
#define LOG_INFO   QDC_LOGFWD(::qdc::logfwd::Level::INFO)
#define LOG_DEBUG  QDC_LOGFWD(::qdc::logfwd::Level::DEBUG)
#define LOG_TRACE  QDC_LOGFWD(::qdc::logfwd::Level::TRACE)

#endif // LOGFAULT_FWD_ENABLE_LOGGING
