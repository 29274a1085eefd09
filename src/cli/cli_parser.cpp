#include "cli/cli_parser.hpp"

namespace hcodec {

namespace {
bool is_key(const std::string& a) {
    return a.rfind("--", 0) == 0 && a.size() > 2;
}
} // namespace

void CliParser::parse(int argc, char** argv) {
    kv_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (!is_key(a)) continue;
        std::vector<std::string>& vals = kv_[a.substr(2)];
        bool took_value = false;
        while (i + 1 < argc) {
            std::string next = argv[i + 1] ? argv[i + 1] : "";
            if (is_key(next)) break;
            vals.push_back(next);
            took_value = true;
            ++i;
        }
        if (!took_value) vals.push_back("true");
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end() || it->second.empty()) return def;
    return it->second.front();
}

std::vector<std::string> CliParser::get_all(const std::string& key) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return {};
    return it->second;
}

bool CliParser::flag(const std::string& key) const {
    const std::string v = get(key);
    return v == "true" || v == "1" || v == "yes";
}

} // namespace hcodec
