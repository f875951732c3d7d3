#include "uplift/core/cli.hpp"
#include <iomanip>
#include <iostream>
#include <utility>

namespace uplift::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option('f', "filename", "File to upload, or an http(s) URL to stream from", true);
    add_option('t', "title", "Video title", true, "Video Title");
    add_option('d', "description", "Video description", true, "uploaded by uplift");
    add_option('\0', "categoryId", "Video category id", true);
    add_option('\0', "tags", "Comma separated list of video tags", true);
    add_option('p', "privacy", "Video privacy status", true);
    add_option('m', "metaJSON", "JSON file with title, description, tags etc", true);
    add_option('r', "ratelimit", "Rate limit upload in kbps (0 = unlimited)", true);
    add_option('\0', "token", "OAuth2 bearer access token", true);
    add_option('c', "config", "Configuration file path", true, "~/.uplift.conf");
    add_option('q', "quiet", "Suppress the progress indicator");
    add_option('\0', "verbose", "Enable verbose logging");
    add_option('h', "help", "Show this help message");
    add_option('v', "version", "Show version information");
}

void CommandLineParser::add_option(char short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    options_.push_back(Option{short_name, long_name, description, has_value, default_value});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    error_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.size() > 2 && arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            const Option* option = find(name);
            if (!option || option->long_name != name) {
                return fail("Unknown option: --" + name);
            }

            if (!option->has_value) {
                if (eq_pos != std::string::npos) {
                    return fail("Option --" + name + " does not take a value");
                }
                values_[name] = "true";
            } else if (eq_pos != std::string::npos) {
                values_[name] = arg.substr(eq_pos + 1);
            } else if (i + 1 < argc) {
                values_[name] = argv[++i];
            } else {
                return fail("Option --" + name + " requires a value");
            }
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            // Switches may be bundled; the first option taking a value ends the
            // bundle and owns the rest of it, or the next argument.
            for (size_t j = 1; j < arg.size(); ++j) {
                const Option* option = find_short(arg[j]);
                if (!option) {
                    return fail(std::string("Unknown option: -") + arg[j]);
                }

                if (!option->has_value) {
                    values_[option->long_name] = "true";
                    continue;
                }

                if (j + 1 < arg.size()) {
                    values_[option->long_name] = arg.substr(j + 1);
                } else if (i + 1 < argc) {
                    values_[option->long_name] = argv[++i];
                } else {
                    return fail(std::string("Option -") + arg[j] + " requires a value");
                }
                break;
            }
        } else {
            return fail("Unexpected argument: " + arg);
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = find(name);
    return option && values_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = find(name);
    if (!option) {
        return default_value;
    }

    auto it = values_.find(option->long_name);
    if (it != values_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " --filename <file|url> [options]\n\n";
    std::cout << "Options:\n";

    for (const auto& option : options_) {
        std::string flags = option.short_name ? std::string("-") + option.short_name + ", " : "    ";
        flags += "--" + option.long_name + (option.has_value ? " <value>" : "");

        std::cout << "  " << std::left << std::setw(28) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << UPLIFT_VERSION << "\n";
    std::cout << "Built with C++20\n";
}

const CommandLineParser::Option* CommandLineParser::find(const std::string& name) const {
    if (name.size() == 1) {
        return find_short(name[0]);
    }
    for (const auto& option : options_) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_short(char short_name) const {
    if (short_name == '\0') {
        return nullptr;
    }
    for (const auto& option : options_) {
        if (option.short_name == short_name) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    values_.clear();
    return false;
}

} // namespace uplift::core
