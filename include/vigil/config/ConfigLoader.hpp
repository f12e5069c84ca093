#pragma once
// =============================================================================
// ConfigLoader.hpp - INI file parser for Vigil policy configuration
// =============================================================================
// [section] headers, key = value pairs, '#' / ';' comments.
// Keys are stored as "section.key". Typed getters fall back to the supplied
// default only when the key is absent; a present but malformed value throws
// ConfigError so a typo never silently becomes a default threshold.
// =============================================================================

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil::config {

class ConfigLoader {
public:
    ConfigLoader() = default;

    // Returns false if the file cannot be opened. Parse errors throw.
    bool load(const std::string& path);
    void parse(std::istream& in);

    bool has(const std::string& section, const std::string& key) const;

    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;
    int getInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double defaultVal = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool defaultVal = false) const;
    std::vector<std::string> getList(const std::string& section, const std::string& key,
                                     const std::vector<std::string>& defaultVal = {}) const;

    void set(const std::string& section, const std::string& key, const std::string& value);

    const std::string& getConfigPath() const { return configPath_; }
    size_t size() const { return values_.size(); }

    void dump(std::ostream& out) const;

private:
    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace vigil::config
