#include <fstream>
#include <iterator>
#include <system_error>
#include "tftpd/payload.hpp"

namespace MiniTftp::Tftpd::FileUtils {
    std::optional<std::u8string> loadPayload(const std::filesystem::path& file_path) {
        std::error_code fs_error;

        if (not std::filesystem::is_regular_file(file_path, fs_error)) {
            return {};
        }

        std::ifstream reader {file_path, std::ios::in | std::ios::binary};

        if (not reader.is_open()) {
            return {};
        }

        std::u8string payload;

        for (auto octet_it = std::istreambuf_iterator<char> {reader}; octet_it != std::istreambuf_iterator<char> {}; ++octet_it) {
            payload += static_cast<char8_t>(*octet_it);
        }

        if (reader.bad()) {
            return {};
        }

        return payload;
    }
}
