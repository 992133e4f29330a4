#pragma once

#include <filesystem>
#include <string>
#include <string_view>

class QString;

QString ToQString(const char* c_string);
QString ToQString(const std::string& string);
QString ToQString(std::string_view string_view);
QString ToQString(const std::filesystem::path& path);
