#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <QString>

/*
        Raw tokens of a single card line, nothing in here has been validated
        Only the sanitizer is supposed to consume these
*/
struct ParsedEntry
{
    QString m_RawQuantity;
    QString m_RawName;
    QString m_RawSetCode;
    QString m_RawCollectorNumber;

    // 1-based line in the source text
    uint32_t m_LineNumber;
};

struct ParsedSection
{
    std::string_view m_Name;
    std::vector<ParsedEntry> m_Entries;
};

struct ParsedDeck
{
    ParsedSection m_Mainboard;
    ParsedSection m_Sideboard;

    std::size_t EntryCount() const;
};

/*
    Deck
    4 Lightning Bolt (M10) 146
    2 Fire // Ice (MH2) 290

    Sideboard
    3 Duress (STA) 28

    Checks the shape of the text only, throws InvalidDeckStructureError if the
    text is not a deck list. A line like "99999999 Bad\x07Name (zz) ?" parses fine.
*/
ParsedDeck ParseDeck(const QString& raw_deck);
