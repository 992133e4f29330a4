#pragma once

#include <string_view>

std::string_view DeckSanitizerVersion();
std::string_view DeckSanitizerBuildTime();

consteval std::string_view CardDatabaseFormatVersion()
{
    return "ADS00001";
}

consteval std::string_view ConfigFormatVersion()
{
    return "ADS00001";
}
