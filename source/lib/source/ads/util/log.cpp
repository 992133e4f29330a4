#include <ads/util/log.hpp>

#include <ads/util/log_impl.hpp>

Log::Log(LogFlags log_flags, std::string_view log_name, LogLevel min_level)
{
    m_Impl = std::make_unique<LogImpl>(log_flags, log_name, min_level);
    m_Impl->RegisterInstance(this);
}

Log::~Log() = default;

Log* Log::GetInstance(std::string_view log_name)
{
    return LogImpl::GetInstance(log_name);
}

uint32_t Log::InstallHook(LogHook hook)
{
    return m_Impl->InstallHook(std::move(hook));
}
void Log::UninstallHook(uint32_t hook_id)
{
    m_Impl->UninstallHook(hook_id);
}

void Log::SetMinLevel(LogLevel level)
{
    m_Impl->SetMinLevel(level);
}
Log::LogLevel Log::GetMinLevel() const
{
    return m_Impl->GetMinLevel();
}

void Log::PrintRaw(const DetailInformation& detail_info, LogLevel level, std::string_view message)
{
    m_Impl->Print(detail_info, level, message);
}
