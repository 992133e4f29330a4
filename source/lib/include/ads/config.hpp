#pragma once

#include <filesystem>
#include <string_view>

#include <ads/util/log.hpp>

struct Config
{
    std::filesystem::path m_CardDatabasePath{ "cards.json" };

    bool m_LogToFile{ false };
    Log::LogLevel m_LogLevel{ Log::LogLevel::Information };
    // File, line and function of each log message
    bool m_LogDetails{ false };

    static inline constexpr std::string_view c_DefaultConfigFile{ "config.ini" };
};

// Creates the file with default values if it does not exist yet
Config LoadConfig(const std::filesystem::path& config_file);
void SaveConfig(const Config& config, const std::filesystem::path& config_file);
