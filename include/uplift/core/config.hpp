#pragma once

#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace uplift::core {

// Flat key=value settings. Keys are dotted ("upload.rate_limit_kbps").
// Files may only set the keys listed by is_known_key(); anything else is
// skipped and reported through load_warnings().
class Config {
public:
    Config() = default;

    static Config& instance();

    // False if the file cannot be opened.
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    // Whole-value integer conversion. Empty on junk, a sign the type cannot
    // hold, or overflow.
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "get_as reads integers");

        auto value = get(key);
        if (!value || value->empty()) return std::nullopt;

        T result{};
        const char* last = value->data() + value->size();
        auto [end, err] = std::from_chars(value->data(), last, result);
        if (err != std::errc() || end != last) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    uint64_t get_uint64(const std::string& key, uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void set_defaults();
    void clear();

    // One message per numeric setting that is present but unusable: the rate
    // limit must be >= 0, chunk size, progress interval and HTTP timeout > 0.
    std::vector<std::string> validate() const;

    // Lines the last load_from_file() skipped, as "line N: reason".
    const std::vector<std::string>& load_warnings() const { return load_warnings_; }

    static bool is_known_key(const std::string& key);

private:
    std::map<std::string, std::string> values_;
    std::vector<std::string> load_warnings_;
};

} // namespace uplift::core
