#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <ads/util/log.hpp>

class Log::LogImpl
{
  public:
    LogImpl(LogFlags log_flags, std::string_view log_name, Log::LogLevel min_level);
    ~LogImpl();

    static Log* GetInstance(std::string_view log_name);

    void RegisterInstance(Log* parent_log);
    void UnregisterInstance();

    uint32_t InstallHook(Log::LogHook hook);
    void UninstallHook(uint32_t hook_id);

    void SetMinLevel(Log::LogLevel level);
    Log::LogLevel GetMinLevel() const;

    void Print(const Log::DetailInformation& detail_info, Log::LogLevel level, std::string_view message);

  private:
    void CreateLogFile();

    Log* m_ParentLog{ nullptr };

    const std::string m_LogName;
    const LogFlags m_LogFlags;
    std::atomic<Log::LogLevel> m_MinLevel;

    std::mutex m_Mutex;

    struct InstalledLogHook
    {
        uint32_t m_HookId;
        Log::LogHook m_Hook;
    };
    std::vector<InstalledLogHook> m_LogHooks;
    uint32_t m_NextHookId{ 1 };

    std::ofstream m_FileStream;

    inline static std::shared_mutex g_InstanceListMutex;
    inline static std::unordered_map<std::string, LogImpl*> g_Instances;
};
