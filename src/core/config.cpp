#include "uplift/core/config.hpp"
#include "uplift/core/utils.hpp"
#include <array>
#include <fstream>

namespace uplift::core {

namespace {

constexpr std::array<const char*, 9> KNOWN_KEYS = {
    "upload.rate_limit_kbps",
    "upload.chunk_size",
    "upload.endpoint",
    "upload.privacy",
    "progress.interval_ms",
    "http.timeout_seconds",
    "log.level",
    "log.file",
    "auth.access_token",
};

// Never written back out by save_to_file().
constexpr const char* SECRET_KEY = "auth.access_token";

} // namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    load_warnings_.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto where = "line " + std::to_string(line_number) + ": ";
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            load_warnings_.push_back(where + "expected key=value");
            continue;
        }

        auto key = utils::StringUtils::trim(line.substr(0, eq_pos));
        if (!is_known_key(key)) {
            load_warnings_.push_back(where + "unknown setting '" + key + "'");
            continue;
        }
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }

    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# uplift configuration\n\n";
    for (const auto& [key, value] : values_) {
        if (key != SECRET_KEY) {
            file << key << "=" << value << "\n";
        }
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    return get_as<uint64_t>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["upload.rate_limit_kbps"] = "0";
    values_["upload.chunk_size"] = "8388608";
    values_["upload.endpoint"] = "https://www.googleapis.com/upload/youtube/v3/videos?uploadType=resumable&part=snippet,status";
    values_["upload.privacy"] = "private";
    values_["progress.interval_ms"] = "1000";
    values_["http.timeout_seconds"] = "30";
    values_["log.level"] = "info";
    values_["log.file"] = "uplift.log";
}

void Config::clear() {
    values_.clear();
    load_warnings_.clear();
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    auto check = [&](const std::string& key, int64_t minimum) {
        if (!has(key)) {
            return;
        }
        auto value = get_as<int64_t>(key);
        if (!value || *value < minimum) {
            problems.push_back(key + " must be an integer of at least " + std::to_string(minimum) +
                               ", got '" + *get(key) + "'");
        }
    };

    check("upload.rate_limit_kbps", 0);
    check("upload.chunk_size", 1);
    check("progress.interval_ms", 1);
    check("http.timeout_seconds", 1);
    return problems;
}

bool Config::is_known_key(const std::string& key) {
    for (const auto* known : KNOWN_KEYS) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

} // namespace uplift::core
