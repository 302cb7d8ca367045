#pragma once
#include <string>
#include <fstream>
#include <istream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <stdexcept>

class Config {
public:
    std::unordered_map<std::string, std::string> values;

    static std::string trim(const std::string& s) {
        std::size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
            ++start;
        }
        std::size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
            --end;
        }
        return s.substr(start, end - start);
    }

    // Expands \t \n \r and \\ so whitespace separators can be written in the ini file.
    static std::string unescape(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] != '\\' || i + 1 == s.size()) {
                out.push_back(s[i]);
                continue;
            }
            char next = s[++i];
            switch (next) {
                case 't': out.push_back('\t'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 's': out.push_back(' '); break;
                case '\\': out.push_back('\\'); break;
                default: out.push_back('\\'); out.push_back(next); break;
            }
        }
        return out;
    }

    bool load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) return false;
        parse(file);
        return true;
    }

    void parse(std::istream& in) {
        std::string line;
        std::string section;
        while (getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[' && line.back() == ']') {
                section = trim(line.substr(1, line.size() - 2));
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, pos));
            std::string val = trim(line.substr(pos + 1));
            if (key.empty()) continue;

            values[key] = val;
            if (!section.empty()) {
                values[section + "." + key] = val;
            }
        }
    }

    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it == values.end() ? fallback : it->second;
    }

    int getInt(const std::string& key, int fallback = 0) const {
        auto raw = get(key);
        if (raw.empty()) return fallback;
        try {
            return std::stoi(raw);
        } catch (const std::invalid_argument&) {
            return fallback;
        } catch (const std::out_of_range&) {
            return fallback;
        }
    }

    bool getBool(const std::string& key, bool fallback = false) const {
        std::string raw = get(key);
        std::transform(raw.begin(), raw.end(), raw.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
        if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return false;
        return fallback;
    }
};
