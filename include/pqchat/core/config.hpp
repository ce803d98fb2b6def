#pragma once

#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace pqchat::core {

class Config {
public:
    Config() = default;

    // Process-wide instance used by the CLI; library code takes a Config& instead
    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) return std::nullopt;
        return result;
    }

    void set_defaults();
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

}
