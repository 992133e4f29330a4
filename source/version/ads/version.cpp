#include <ads/version.hpp>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

std::string_view DeckSanitizerVersion()
{
#ifdef ADS_VERSION
    return TOSTRING(ADS_VERSION);
#else
    return "<unknown version>";
#endif
}

std::string_view DeckSanitizerBuildTime()
{
#ifdef ADS_NOW
    return TOSTRING(ADS_NOW);
#else
    return "<unknown build time>";
#endif
}
