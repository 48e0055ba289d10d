#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns config.toml and hands each registered top-level section to its callbacks.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    // One owner per section name.
    bool registerTable(const std::string& name, TableCallbacks cb);

    // A missing file dispatches empty sections. A parse error is reported once and
    // leaves the handlers untouched.
    bool load();
    bool reloadIfChanged();

    // Merges every section into the last parsed document and replaces the file.
    // Refuses while the file on disk does not parse.
    bool save();

    const toml::table& root() const { return root_; }
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }
    bool fileUnreadable() const { return parse_failed_; }

private:
    void dispatch() const;
    bool writeFile(const toml::table& doc);

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;
    bool parse_failed_ = false;

    std::vector<std::pair<std::string, TableCallbacks>> sections_;
    toml::table root_;
};
