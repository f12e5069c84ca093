#include "vigil/config/ConfigLoader.hpp"
#include "vigil/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

namespace vigil::config {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool ConfigLoader::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[CONFIG] cannot open " << path << "\n";
        return false;
    }
    configPath_ = path;
    parse(file);
    std::cerr << "[CONFIG] loaded " << values_.size() << " keys from " << path << "\n";
    return true;
}

void ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;
    int lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos == std::string::npos) {
                throw ConfigError("config line " + std::to_string(lineNo) +
                                        ": unterminated section header");
            }
            currentSection = trim(line.substr(1, closePos - 1));
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            throw ConfigError("config line " + std::to_string(lineNo) +
                                    ": expected key = value");
        }

        std::string key = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) {
            throw ConfigError("config line " + std::to_string(lineNo) + ": empty key");
        }
        values_[currentSection + "." + key] = value;
    }
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.find(section + "." + key) != values_.end();
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    if (it != values_.end()) {
        return it->second;
    }
    return defaultVal;
}

int ConfigLoader::getInt(const std::string& section, const std::string& key,
                         int defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("config " + section + "." + key + ": not an integer: " + val);
    }
}

double ConfigLoader::getDouble(const std::string& section, const std::string& key,
                               double defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        double v = std::stod(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("config " + section + "." + key + ": not a number: " + val);
    }
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key,
                           bool defaultVal) const {
    std::string val = lower(get(section, key));
    if (val.empty()) return defaultVal;
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    throw ConfigError("config " + section + "." + key + ": not a boolean: " + val);
}

std::vector<std::string> ConfigLoader::getList(const std::string& section, const std::string& key,
                                               const std::vector<std::string>& defaultVal) const {
    if (!has(section, key)) return defaultVal;
    std::vector<std::string> out;
    std::stringstream ss(get(section, key));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

void ConfigLoader::set(const std::string& section, const std::string& key,
                       const std::string& value) {
    values_[section + "." + key] = value;
}

void ConfigLoader::dump(std::ostream& out) const {
    std::map<std::string, std::string> sorted(values_.begin(), values_.end());
    out << "[CONFIG] Loaded from: " << (configPath_.empty() ? "<memory>" : configPath_) << "\n";
    for (const auto& kv : sorted) {
        out << "  " << kv.first << " = " << kv.second << "\n";
    }
}

} // namespace vigil::config
