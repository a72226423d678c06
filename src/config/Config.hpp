#pragma once

#include <string>
#include <map>
#include <fstream>
#include <istream>
#include <stdexcept>

/**
 * Config - Simple INI-style configuration manager
 *
 * Singleton pattern for easy access from anywhere.
 * Stores key=value pairs; '#' and ';' start comment lines, [sections] are ignored.
 * Keys and values are trimmed of surrounding whitespace.
 */
class Config {
public:
    static Config& Instance() {
        static Config instance;
        return instance;
    }

    // Returns false if the file could not be opened
    bool Load(const std::string& filename = "nesdma.ini") {
        m_filename = filename;
        std::ifstream file(filename);
        if (!file.is_open()) return false;
        Parse(file);
        return true;
    }

    void Parse(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            line = Trim(line);
            if (line.empty() || line[0] == ';' || line[0] == '#' || line[0] == '[') continue;

            size_t delimiterPos = line.find('=');
            if (delimiterPos != std::string::npos) {
                std::string key = Trim(line.substr(0, delimiterPos));
                std::string value = Trim(line.substr(delimiterPos + 1));
                if (!key.empty()) m_data[key] = value;
            }
        }
    }

    bool Save() const {
        if (m_filename.empty()) return false;
        std::ofstream file(m_filename);
        if (!file.is_open()) return false;

        for (const auto& [key, value] : m_data) {
            file << key << "=" << value << "\n";
        }
        return true;
    }

    void Clear() {
        m_data.clear();
        m_filename.clear();
    }

    std::string Get(const std::string& key, const std::string& defaultValue = "") const {
        auto it = m_data.find(key);
        if (it != m_data.end()) {
            return it->second;
        }
        return defaultValue;
    }

    void Set(const std::string& key, const std::string& value) {
        m_data[key] = value;
    }

    int GetInt(const std::string& key, int defaultValue = 0) const {
        std::string val = Get(key);
        if (val.empty()) return defaultValue;
        try {
            return std::stoi(val, nullptr, 0);
        } catch (const std::logic_error&) {
            return defaultValue;
        }
    }

    void SetInt(const std::string& key, int value) {
        Set(key, std::to_string(value));
    }

    bool GetBool(const std::string& key, bool defaultValue = false) const {
        std::string val = Get(key);
        if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
        if (val == "0" || val == "false" || val == "no" || val == "off") return false;
        return defaultValue;
    }

private:
    std::map<std::string, std::string> m_data;
    std::string m_filename;

    static std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t begin = s.find_first_not_of(ws);
        if (begin == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(begin, end - begin + 1);
    }

    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
};
