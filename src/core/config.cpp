#include "pqchat/core/config.hpp"
#include "pqchat/core/utils.hpp"
#include <algorithm>
#include <cctype>

namespace pqchat::core {

using utils::StringUtils;

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string line;
    while (std::getline(file, line)) {
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = StringUtils::trim(line.substr(0, eq_pos));
        std::string value = StringUtils::trim(line.substr(eq_pos + 1));

        if (!key.empty()) {
            values_[key] = value;
        }
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# pqchat configuration\n\n";

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    std::string lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_["crypto.kem"] = "KYBER";
    values_["crypto.symmetric"] = "AES-256";
    values_["crypto.signature"] = "FALCON";
    values_["handshake.secret_ttl_seconds"] = "300";
    values_["handshake.require_signatures"] = "false";
    values_["handshake.include_algorithms"] = "true";
    values_["worker.threads"] = "4";
    values_["storage.database"] = "pqchat.db";
    values_["log.level"] = "info";
    values_["log.file"] = "pqchat.log";
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

}
