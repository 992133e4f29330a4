#include <ads/util/log_impl.hpp>

#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name, Log::LogLevel min_level)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
    , m_MinLevel(min_level)
{
    if (IsAnySet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock<std::shared_mutex> read_lock(g_InstanceListMutex);

    auto it = g_Instances.find(std::string{ log_name });
    if (it != g_Instances.end())
        return it->second->m_ParentLog;
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    m_ParentLog = parent_log;

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    }
    g_Instances[m_LogName] = this;
}
void Log::LogImpl::UnregisterInstance()
{
    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    auto it = g_Instances.find(m_LogName);
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
    m_ParentLog = nullptr;
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    const uint32_t hook_id{ m_NextHookId++ };
    m_LogHooks.push_back({ hook_id, std::move(hook) });
    return hook_id;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks,
                  [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

void Log::LogImpl::SetMinLevel(Log::LogLevel level)
{
    m_MinLevel = level;
}
Log::LogLevel Log::LogImpl::GetMinLevel() const
{
    return m_MinLevel;
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message)
{
    std::stringstream stream;

    // The error prefix
    const char* prefix{ "[???]" };
    switch (level)
    {
    case LogLevel::Debug:
        prefix = "[DEBUG]";
        break;
    case LogLevel::Information:
        prefix = " [INFO]";
        break;
    case LogLevel::Warning:
        prefix = " [WARN]";
        break;
    case LogLevel::Error:
        prefix = "[ERROR]";
        break;
    }
    stream << prefix;

    // Detailed information, e.g. time, file, line...
    if (IsAnySet(m_LogFlags, LogFlags::DetailAll))
    {
        std::vector<std::string> details;
        if (IsAnySet(m_LogFlags, LogFlags::DetailTime))
        {
            details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailFile))
        {
            std::string_view file{ detail_info.m_File };
#ifdef ADS_SOURCE_ROOT
            if (file.starts_with(ADS_SOURCE_ROOT))
            {
                file.remove_prefix(std::string_view{ ADS_SOURCE_ROOT }.size());
            }
#endif
            details.emplace_back(file);
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailLine))
        {
            details.push_back(std::to_string(detail_info.m_Line));
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailFunction))
        {
            details.emplace_back(detail_info.m_Function);
        }
        stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
    }

    stream << ": " << message << "\n";

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    if (IsAnySet(m_LogFlags, LogFlags::Console))
    {
        qDebug().noquote() << QString::fromStdString(full_message_str).trimmed();
    }
    if (m_FileStream.is_open())
    {
        m_FileStream << full_message_str << std::flush;
    }

    // Forward to hooks
    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

void Log::LogImpl::CreateLogFile()
{
    namespace fs = std::filesystem;

    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    const std::string file_name{
        fmt::format("{:%Y-%m-%d_%H-%M-%S}.log", fmt::localtime(std::time(nullptr)))
    };

    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(logs_directory / file_name);
}
