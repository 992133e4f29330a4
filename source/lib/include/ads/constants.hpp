#pragma once

#include <array>
#include <cstdint>
#include <string_view>

inline constexpr uint32_t c_MinCardQuantity{ 1 };
inline constexpr uint32_t c_MaxCardQuantity{ 250 };

inline constexpr std::size_t c_MaxCardNameLength{ 150 };
inline constexpr std::size_t c_MaxSetCodeLength{ 6 };
inline constexpr std::size_t c_MaxCollectorNumberLength{ 10 };

inline constexpr std::size_t c_MaxDeckTextLength{ 100'000 };
inline constexpr std::size_t c_MaxDeckEntries{ 250 };
// Longest card line the parser looks at, room for quantity, separators and parentheses on top of the fields
inline constexpr std::size_t c_MaxDeckLineLength{ c_MaxCardNameLength + c_MaxSetCodeLength + c_MaxCollectorNumberLength + 32 };

inline constexpr std::string_view c_MainboardHeader{ "Deck" };
inline constexpr std::string_view c_SideboardHeader{ "Sideboard" };

// Set codes Arena does not accept for import, stored lower-case
inline constexpr std::array c_ArenaInvalidSets{
    // The List
    std::string_view{ "plst" },
    std::string_view{ "plist" },
    // Multiverse Legends
    std::string_view{ "mul" },
    // Mystery Booster
    std::string_view{ "mb1" },
    std::string_view{ "mb2" },
    std::string_view{ "fmb1" },
    std::string_view{ "cmb1" },
    std::string_view{ "cmb2" },
    // Secret Lair
    std::string_view{ "sld" },
    // Promos
    std::string_view{ "prm" },
    std::string_view{ "phed" },
    std::string_view{ "plg20" },
    std::string_view{ "plg21" },
    std::string_view{ "plg22" },
    std::string_view{ "plg23" },
    std::string_view{ "pmei" },
    std::string_view{ "pnat" },
    // Judge promos
    std::string_view{ "j14" },
    std::string_view{ "j15" },
    std::string_view{ "j16" },
    std::string_view{ "j17" },
    std::string_view{ "j18" },
    std::string_view{ "j19" },
    std::string_view{ "j20" },
    std::string_view{ "j21" },
    std::string_view{ "j22" },
    // World Championship decks
    std::string_view{ "wc97" },
    std::string_view{ "wc98" },
    std::string_view{ "wc99" },
    std::string_view{ "wc00" },
    std::string_view{ "wc01" },
    std::string_view{ "wc02" },
    std::string_view{ "wc03" },
    std::string_view{ "wc04" },
    // Collectors' Edition
    std::string_view{ "cei" },
    std::string_view{ "ced" },
    // 30th Anniversary Edition
    std::string_view{ "30a" },
    // Foreign-only
    std::string_view{ "rin" },
    std::string_view{ "ren" },
};

// Case-insensitive membership test against c_ArenaInvalidSets
bool IsArenaInvalidSet(std::string_view set_code);
