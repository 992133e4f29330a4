#include <ads/qt_util.hpp>

#include <QString>

QString ToQString(const char* c_string)
{
    return QString::fromUtf8(c_string);
}

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(std::string_view string_view)
{
    return QString::fromUtf8(string_view.data(), static_cast<qsizetype>(string_view.size()));
}

QString ToQString(const std::filesystem::path& path)
{
    return QString::fromStdU16String(path.u16string());
}
