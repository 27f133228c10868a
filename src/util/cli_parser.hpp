#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fastaclass {

// Command-line parser for "-key value", "--key=value" and bare "-flag"
// arguments. Anything not attached to a key is positional; "--" ends
// option parsing. A lone "-" is a value (stdin/stdout placeholder).
// Keys listed in flags never take a value, so "-v input.fa" leaves
// input.fa positional.
class CliParser {
public:
    CliParser(int argc, char* argv[],
              std::initializer_list<std::string> flags = {});

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Last value given for key, or default_val if absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for a repeated key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    const std::string& program() const { return program_; }

    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
    std::unordered_set<std::string> flags_;
};

} // namespace fastaclass
