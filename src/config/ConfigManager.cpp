#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace
{

// 0 when the file does not exist.
long long modified_ms(const std::string& path)
{
    std::error_code ec;
    const auto written = fs::last_write_time(path, ec);
    if (ec)
        return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(written.time_since_epoch()).count();
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
    , last_mtime_(modified_ms(config_path_))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& name, TableCallbacks cb)
{
    const bool taken = std::any_of(sections_.begin(), sections_.end(),
                                   [&name](const auto& section) { return section.first == name; });
    if (taken || name.empty())
    {
        last_error_ = "Section '" + name + "' already has a handler";
        PLOG_ERROR << last_error_;
        return false;
    }

    sections_.emplace_back(name, std::move(cb));
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::error_code ec;
    if (!fs::exists(config_path_, ec))
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = toml::table{};
        parse_failed_ = false;
        dispatch();
        return true;
    }

    // Recorded before parsing so a broken file is reported once per edit.
    last_mtime_ = modified_ms(config_path_);
    try
    {
        root_ = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        parse_failed_ = true;
        last_error_ = "config parse error at line " + std::to_string(pe.source().begin.line) + ": " +
                      std::string(pe.description());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors and was not applied",
                                            last_error_ + "\nFile: " + config_path_);
        return false;
    }

    parse_failed_ = false;
    dispatch();
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    const long long mtime = modified_ms(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (!load())
        return false;

    PLOG_INFO << "Config reloaded from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();
    if (parse_failed_)
    {
        last_error_ = "config file does not parse, leaving it untouched";
        PLOG_WARNING << last_error_ << ": " << config_path_;
        return false;
    }

    toml::table doc = root_;
    for (const auto& [name, callbacks] : sections_)
    {
        if (!callbacks.save)
            continue;

        toml::table values = callbacks.save();
        if (auto* existing = doc[name].as_table())
        {
            // Keys this build does not know about stay in the section.
            for (auto&& [key, value] : values)
                existing->insert_or_assign(key, value);
        }
        else
        {
            doc.insert_or_assign(name, std::move(values));
        }
    }

    if (!writeFile(doc))
        return false;

    root_ = std::move(doc);
    last_mtime_ = modified_ms(config_path_);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

void ConfigManager::dispatch() const
{
    static const toml::table empty;
    for (const auto& [name, callbacks] : sections_)
    {
        if (!callbacks.load)
            continue;
        const toml::table* section = root_[name].as_table();
        callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::writeFile(const toml::table& doc)
{
    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            last_error_ = "cannot open " + tmp + " for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
        out << doc << '\n';
        if (!out.flush())
        {
            last_error_ = "write to " + tmp + " failed";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = "rename of " + tmp + " failed: " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
