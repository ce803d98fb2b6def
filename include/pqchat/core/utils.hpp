#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pqchat::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string to_upper(const std::string& str);

    // Upper-case hex, two characters per byte
    static std::string to_hex(std::span<const std::uint8_t> bytes);
    static std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex);

    static std::string format_bytes(size_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static std::optional<size_t> file_size(const std::filesystem::path& path);
    static std::optional<std::vector<std::uint8_t>> read_binary(const std::filesystem::path& path);
    static bool write_binary(const std::filesystem::path& path, std::span<const std::uint8_t> content);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t to_unix_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_unix_millis(std::int64_t millis);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
