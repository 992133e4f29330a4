#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <ads/deck/sanitized_deck.hpp>

class QString;
class PrintingOracle;
struct ParsedEntry;
struct ParsedSection;

struct CardCount
{
    std::string m_Name;
    uint32_t m_Quantity;
};

/*
        The trust boundary between untrusted deck text and SanitizedDeck
        Every check is a hard gate, the first violation throws a SanitizationError
        and nothing is ever returned partially or substituted
*/
class DeckSanitizer
{
  public:
    DeckSanitizer(const PrintingOracle& oracle);

    SanitizedDeck Sanitize(const QString& raw_deck) const;

    // For decks built from card names, each name is resolved to its canonical printing
    SanitizedDeck SanitizeCardCounts(std::span<const CardCount> mainboard,
                                     std::span<const CardCount> sideboard) const;

  private:
    struct ValidatedEntry
    {
        uint32_t m_Quantity;
        std::string m_Name;
        std::string m_SetCode;
        std::string m_CollectorNumber;
        // Unset for entries that do not stem from deck text
        std::optional<uint32_t> m_LineNumber;
    };

    static void CheckRawText(const QString& raw_deck);
    static std::vector<ValidatedEntry> ValidateFields(const ParsedSection& section);
    static ValidatedEntry ValidateFields(const ParsedEntry& entry);

    void ConfirmPrintings(const std::vector<ValidatedEntry>& entries) const;
    void ConfirmPrinting(const ValidatedEntry& entry) const;

    static void RejectDuplicates(const std::vector<ValidatedEntry>& entries, std::string_view section_name);

    std::vector<ValidatedEntry> ResolveCardCounts(std::span<const CardCount> card_counts,
                                                 std::string_view section_name) const;

    static std::vector<SanitizedCard> ToCards(std::vector<ValidatedEntry> entries);

    const PrintingOracle& m_Oracle;
};

SanitizedDeck SanitizeDeckForArena(const QString& raw_deck, const PrintingOracle& oracle);

SanitizedDeck SanitizeCardCounts(std::span<const CardCount> mainboard,
                                 std::span<const CardCount> sideboard,
                                 const PrintingOracle& oracle);
