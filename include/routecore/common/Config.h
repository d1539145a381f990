#pragma once

#include "routecore/common/noncopyable.h"

#include <iosfwd>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace routecore {
namespace common {

// INI-style settings store:
//   [section]
//   key = value      ; '#' and ';' start comment lines
// Keys outside any section land in [global].
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    // Process-wide instance used by the sim driver. Tests may create their own.
    static Config& Instance();

    Config() = default;

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    // Returns the last loaded config filename if available.
    std::optional<std::string> LoadedFilename() const;

    // Returns a snapshot copy of all settings (thread-safe).
    std::map<std::string, Section> GetAll() const;

    bool HasSection(const std::string& section) const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Numeric getters return the default when the key is missing or malformed.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Get sections whose name starts with prefix, returning (section_name, key->value) pairs.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

private:
    static std::string Trim(const std::string& s);
    static std::map<std::string, Section> ParseIni(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace routecore
