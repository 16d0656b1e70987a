#include <array>
#include <utility>
#include "meta/logging.hpp"

namespace MiniTftp::Meta {
    static constexpr std::array<std::string_view, static_cast<std::size_t>(LogLevel::last) + 1> level_names = {
        "DEBUG",
        "INFO",
        "WARNING",
        "ERROR"
    };

    std::string_view toLevelName(LogLevel level) noexcept {
        return level_names[static_cast<std::size_t>(level)];
    }

    ConsoleSink::ConsoleSink(std::string tag, LogLevel min_level, std::ostream& out)
    : m_mtx {}, m_out {out}, m_tag {std::move(tag)}, m_min_level {min_level} {}

    void ConsoleSink::write(LogLevel level, std::string_view text) {
        if (level < m_min_level) {
            return;
        }

        std::lock_guard lock {m_mtx};
        m_out << m_tag << " [" << toLevelName(level) << "]: " << text << '\n';
    }

    static NullSink& fallbackSink() noexcept {
        static NullSink sink;
        return sink;
    }

    Logger::Logger() noexcept
    : m_sink {&fallbackSink()} {}

    Logger::Logger(LogSink& sink) noexcept
    : m_sink {&sink} {}
}
