#include <ads/config.hpp>

#include <QFile>
#include <QSettings>

#include <magic_enum/magic_enum.hpp>

#include <ads/qt_util.hpp>
#include <ads/version.hpp>

Config LoadConfig(const std::filesystem::path& config_file)
{
    Config config{};
    if (!QFile::exists(ToQString(config_file)))
    {
        LogInfo("No config found at {}, writing defaults...", config_file.string());
        SaveConfig(config, config_file);
        return config;
    }

    QSettings settings(ToQString(config_file), QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");

        const auto version{ settings.value("Format.Version").toString().toStdString() };
        if (!version.empty() && version != ConfigFormatVersion())
        {
            LogWarning("Config {} has format version {}, expected {}...", config_file.string(), version, ConfigFormatVersion());
        }

        config.m_CardDatabasePath = settings.value("Card.Database", "cards.json").toString().toStdU16String();
        config.m_LogToFile = settings.value("Log.File", false).toBool();
        config.m_LogDetails = settings.value("Log.Details", false).toBool();
        {
            const auto log_level{ settings.value("Log.Level", "Information").toString().toStdString() };
            const auto parsed_log_level{ magic_enum::enum_cast<Log::LogLevel>(log_level) };
            if (!parsed_log_level.has_value())
            {
                LogWarning("Unknown log level {} in config, using {}...", log_level, magic_enum::enum_name(config.m_LogLevel));
            }
            config.m_LogLevel = parsed_log_level.value_or(config.m_LogLevel);
        }

        settings.endGroup();
    }
    else
    {
        LogError("Failed reading config {}, using defaults...", config_file.string());
    }

    return config;
}

void SaveConfig(const Config& config, const std::filesystem::path& config_file)
{
    QSettings settings(ToQString(config_file), QSettings::IniFormat);
    if (settings.status() == QSettings::Status::NoError)
    {
        settings.beginGroup("DEFAULT");
        settings.setValue("Format.Version", ToQString(ConfigFormatVersion()));
        settings.setValue("Card.Database", ToQString(config.m_CardDatabasePath));
        settings.setValue("Log.File", config.m_LogToFile);
        settings.setValue("Log.Level", ToQString(magic_enum::enum_name(config.m_LogLevel)));
        settings.setValue("Log.Details", config.m_LogDetails);
        settings.endGroup();
    }
    settings.sync();
}
