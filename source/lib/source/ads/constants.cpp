#include <ads/constants.hpp>

#include <algorithm>
#include <cctype>
#include <string>

bool IsArenaInvalidSet(std::string_view set_code)
{
    std::string lower_set_code{ set_code };
    std::ranges::transform(lower_set_code,
                           lower_set_code.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return std::ranges::contains(c_ArenaInvalidSets, std::string_view{ lower_set_code });
}
