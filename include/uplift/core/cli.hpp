#pragma once

#include <map>
#include <string>
#include <vector>

namespace uplift::core {

// Parses the uploader's flags: --name value, --name=value, -n value, -nvalue
// and bundled switches (-qv). Every argument has to belong to an option.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    // short_name is '\0' for options that only have a long form.
    void add_option(char short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    // False on the first bad argument; get_error() says which.
    bool parse(int argc, char* argv[]);

    // Options are looked up by long name or by their one-letter short name.
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        char short_name = '\0';
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> values_;
    std::string error_;

    const Option* find(const std::string& name) const;
    const Option* find_short(char short_name) const;
    bool fail(std::string message);
};

} // namespace uplift::core
