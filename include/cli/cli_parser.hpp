#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hcodec {

// Very small CLI parser:
//   --key value [value ...]
//   --flag (treated as "true")
// Repeating a key appends to its values.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    // First value of key, or def.
    std::string get(const std::string& key, const std::string& def = "") const;
    std::vector<std::string> get_all(const std::string& key) const;
    // "true", "1" and "yes" are set; absent is false.
    bool flag(const std::string& key) const;
private:
    std::unordered_map<std::string, std::vector<std::string>> kv_;
};

} // namespace hcodec
