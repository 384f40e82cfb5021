#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fastmarc {

// Options that never take a value; anything following them is positional.
static bool is_flag(const std::string& key) {
    static const char* const kFlags[] = {
        "-v", "--verbose", "-q", "--quiet", "-h", "--help", "--version",
        "-json", "-seekmap", "-validate", "-no_mmap",
    };
    for (const char* f : kFlags) {
        if (key == f) return true;
    }
    return false;
}

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)] = arg.substr(eq + 1);
                    continue;
                }
            }

            if (!is_flag(arg) && i + 1 < argc && argv[i + 1][0] != '-') {
                opts_[arg] = argv[i + 1];
                i++;
            } else {
                opts_[arg] = "1";
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                   const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return default_val;
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end()) return default_val;
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

} // namespace fastmarc
