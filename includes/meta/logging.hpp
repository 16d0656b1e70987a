#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace MiniTftp::Meta {
    enum class LogLevel : unsigned char {
        debug,
        info,
        warning,
        error,
        last = error
    };

    [[nodiscard]] std::string_view toLevelName(LogLevel level) noexcept;

    /**
     * @brief Destination for finished log lines. Implementations must tolerate calls from several threads at once.
     */
    class LogSink {
    public:
        virtual ~LogSink() = default;
        virtual void write(LogLevel level, std::string_view text) = 0;
    };

    class NullSink final : public LogSink {
    public:
        void write([[maybe_unused]] LogLevel level, [[maybe_unused]] std::string_view text) override {}
    };

    /// NOTE: Writes `<tag> [LEVEL]: <text>` lines, to std::clog unless told otherwise.
    class ConsoleSink final : public LogSink {
    private:
        std::mutex m_mtx;
        std::ostream& m_out;
        std::string m_tag;
        LogLevel m_min_level;

    public:
        ConsoleSink() = delete;
        ConsoleSink(std::string tag, LogLevel min_level, std::ostream& out = std::clog);

        void write(LogLevel level, std::string_view text) override;
    };

    /**
     * @brief Non-owning handle over a sink. Copies are cheap and share the same sink, which must outlive every copy.
     * @note A default-constructed logger discards everything.
     */
    class Logger {
    private:
        LogSink* m_sink;

    public:
        Logger() noexcept;
        explicit Logger(LogSink& sink) noexcept;

        template <LogLevel L, typename ... Args>
        void logMessage(Args&& ... args) const {
            std::ostringstream line;
            (line << ... << std::forward<Args>(args));

            m_sink->write(L, line.str());
        }
    };
}
