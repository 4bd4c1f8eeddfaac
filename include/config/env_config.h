#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace PulseAnalyzer {

/**
 * Simple .env parser.
 * KEY=VALUE per line, '#' comments. Values from the file win over
 * environment variables of the same name.
 */
class EnvConfig {
public:
    EnvConfig() = default;

    static EnvConfig& instance() {
        static EnvConfig instance;
        return instance;
    }

    // Load .env file (if present)
    bool load(const std::string& path = ".env") {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }
        return parse(file);
    }

    bool parse(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            // "export KEY=VALUE" as written by shell-style .env files
            if (line.compare(0, 7, "export ") == 0) {
                line = trim(line.substr(7));
            }

            auto pos = line.find('=');
            if (pos != std::string::npos) {
                std::string key = trim(line.substr(0, pos));
                std::string value = unquote(trim(line.substr(pos + 1)));
                if (!key.empty()) {
                    m_values[key] = value;
                }
            }
        }
        return true;
    }

    void set(const std::string& key, const std::string& value) {
        m_values[key] = value;
    }

    // Getter with fallback to environment variable
    std::string getString(const std::string& key, const std::string& defaultValue = "") const {
        auto it = m_values.find(key);
        if (it != m_values.end()) {
            return it->second;
        }

        if (m_useEnvironment) {
            const char* env = std::getenv(key.c_str());
            if (env) return env;
        }
        return defaultValue;
    }

    bool hasKey(const std::string& key) const {
        if (m_values.count(key)) return true;
        return m_useEnvironment && std::getenv(key.c_str()) != nullptr;
    }

    // Only keys from loaded files / set(), the environment is not enumerated
    std::vector<std::string> getKeysWithPrefix(const std::string& prefix) const {
        std::vector<std::string> keys;
        for (const auto& kv : m_values) {
            if (kv.first.compare(0, prefix.size(), prefix) == 0) {
                keys.push_back(kv.first);
            }
        }
        return keys;
    }

    // Tests disable the process environment to stay hermetic
    void setUseEnvironment(bool use) { m_useEnvironment = use; }

    void clear() { m_values.clear(); }

private:
    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        size_t end = s.find_last_not_of(" \t\r\n");
        return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
    }

    static std::string unquote(const std::string& s) {
        if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
            return s.substr(1, s.size() - 2);
        }
        return s;
    }

    std::unordered_map<std::string, std::string> m_values;
    bool m_useEnvironment = true;
};

} // namespace PulseAnalyzer
