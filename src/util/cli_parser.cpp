#include "util/cli_parser.hpp"

namespace fastaclass {

static bool is_option(const char* arg) {
    return arg[0] == '-' && arg[1] != '\0';
}

CliParser::CliParser(int argc, char* argv[],
                     std::initializer_list<std::string> flags)
    : flags_(flags) {
    if (argc > 0) {
        program_ = argv[0];
    }

    bool options_done = false;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (options_done || !is_option(argv[i])) {
            positional_.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        // --key=value
        if (arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                continue;
            }
        }

        // -key value, or a bare flag when no value follows
        if (!flags_.count(arg) && i + 1 < argc && !is_option(argv[i + 1])) {
            opts_[arg].push_back(argv[i + 1]);
            i++;
        } else {
            opts_[arg].push_back("1");
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

} // namespace fastaclass
