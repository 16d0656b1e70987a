#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace MiniTftp::Tftpd::FileUtils {
    /// @brief Reads the whole file as raw octets. Empty when the path is not a readable regular file.
    [[nodiscard]] std::optional<std::u8string> loadPayload(const std::filesystem::path& file_path);
}
