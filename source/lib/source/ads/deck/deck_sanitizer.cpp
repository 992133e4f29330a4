#include <ads/deck/deck_sanitizer.hpp>

#include <set>
#include <tuple>
#include <utility>

#include <QString>

#include <fmt/format.h>

#include <ads/constants.hpp>
#include <ads/deck/deck_parser.hpp>
#include <ads/deck/errors.hpp>
#include <ads/deck/field_validators.hpp>
#include <ads/deck/printing_oracle.hpp>
#include <ads/qt_util.hpp>
#include <ads/util/log.hpp>

namespace
{
// Raw input never ends up in the log, only what kind of error happened and where
void LogRejection(const SanitizationError& error)
{
    const auto line_number{ error.GetLineNumber() };
    if (line_number.has_value())
    {
        LogWarning("Rejected deck, {} on line {}", ErrorKindName(error.GetKind()), line_number.value());
    }
    else
    {
        LogWarning("Rejected deck, {}", ErrorKindName(error.GetKind()));
    }
}
} // namespace

DeckSanitizer::DeckSanitizer(const PrintingOracle& oracle)
    : m_Oracle{ oracle }
{
}

SanitizedDeck DeckSanitizer::Sanitize(const QString& raw_deck) const
{
    try
    {
        CheckRawText(raw_deck);

        const ParsedDeck parsed_deck{ ParseDeck(raw_deck) };
        if (parsed_deck.EntryCount() > c_MaxDeckEntries)
        {
            throw InvalidDeckStructureError{
                fmt::format("Deck has {} entries, at most {} are allowed", parsed_deck.EntryCount(), c_MaxDeckEntries)
            };
        }
        if (parsed_deck.m_Mainboard.m_Entries.empty())
        {
            throw InvalidDeckStructureError{ "Deck has no mainboard cards" };
        }

        auto mainboard{ ValidateFields(parsed_deck.m_Mainboard) };
        auto sideboard{ ValidateFields(parsed_deck.m_Sideboard) };

        ConfirmPrintings(mainboard);
        ConfirmPrintings(sideboard);

        RejectDuplicates(mainboard, c_MainboardHeader);
        RejectDuplicates(sideboard, c_SideboardHeader);

        LogDebug("Sanitized deck with {} mainboard and {} sideboard entries", mainboard.size(), sideboard.size());
        return SanitizedDeck{ ToCards(std::move(mainboard)), ToCards(std::move(sideboard)) };
    }
    catch (const SanitizationError& e)
    {
        LogRejection(e);
        throw;
    }
}

SanitizedDeck DeckSanitizer::SanitizeCardCounts(std::span<const CardCount> mainboard,
                                                std::span<const CardCount> sideboard) const
{
    try
    {
        if (mainboard.empty())
        {
            throw InvalidDeckStructureError{ "Deck has no mainboard cards" };
        }
        if (mainboard.size() + sideboard.size() > c_MaxDeckEntries)
        {
            throw InvalidDeckStructureError{
                fmt::format("Deck has {} entries, at most {} are allowed", mainboard.size() + sideboard.size(), c_MaxDeckEntries)
            };
        }

        auto main_entries{ ResolveCardCounts(mainboard, c_MainboardHeader) };
        auto side_entries{ ResolveCardCounts(sideboard, c_SideboardHeader) };

        ConfirmPrintings(main_entries);
        ConfirmPrintings(side_entries);

        return SanitizedDeck{ ToCards(std::move(main_entries)), ToCards(std::move(side_entries)) };
    }
    catch (const SanitizationError& e)
    {
        LogRejection(e);
        throw;
    }
}

void DeckSanitizer::CheckRawText(const QString& raw_deck)
{
    if (raw_deck.trimmed().isEmpty())
    {
        throw InvalidDeckStructureError{ "Deck list is empty" };
    }

    if (static_cast<std::size_t>(raw_deck.size()) > c_MaxDeckTextLength)
    {
        throw InvalidDeckStructureError{
            fmt::format("Deck list exceeds maximum length of {} characters", c_MaxDeckTextLength)
        };
    }

    if (raw_deck.contains(QChar{ u'\0' }))
    {
        throw InvalidDeckStructureError{ "Deck list contains NUL characters" };
    }
}

std::vector<DeckSanitizer::ValidatedEntry> DeckSanitizer::ValidateFields(const ParsedSection& section)
{
    std::vector<ValidatedEntry> entries;
    entries.reserve(section.m_Entries.size());
    for (const ParsedEntry& entry : section.m_Entries)
    {
        entries.push_back(ValidateFields(entry));
    }
    return entries;
}

DeckSanitizer::ValidatedEntry DeckSanitizer::ValidateFields(const ParsedEntry& entry)
{
    try
    {
        // Order matters, the first failing field is the one reported
        const uint32_t quantity{ ValidateQuantity(entry.m_RawQuantity) };
        std::string name{ ValidateCardName(entry.m_RawName) };
        std::string set_code{ ValidateSetCode(entry.m_RawSetCode) };
        std::string collector_number{ ValidateCollectorNumber(entry.m_RawCollectorNumber) };

        return ValidatedEntry{
            .m_Quantity = quantity,
            .m_Name{ std::move(name) },
            .m_SetCode{ std::move(set_code) },
            .m_CollectorNumber{ std::move(collector_number) },
            .m_LineNumber = entry.m_LineNumber,
        };
    }
    catch (SanitizationError& e)
    {
        e.SetLineNumber(entry.m_LineNumber);
        throw;
    }
}

void DeckSanitizer::ConfirmPrintings(const std::vector<ValidatedEntry>& entries) const
{
    for (const ValidatedEntry& entry : entries)
    {
        ConfirmPrinting(entry);
    }
}

void DeckSanitizer::ConfirmPrinting(const ValidatedEntry& entry) const
{
    const auto with_context{
        [&entry](auto error)
        {
            if (entry.m_LineNumber.has_value())
            {
                error.SetLineNumber(entry.m_LineNumber.value());
            }
            error.SetCardName(entry.m_Name);
            return error;
        }
    };

    bool is_valid{ false };
    std::optional<Printing> canonical_printing{};
    try
    {
        is_valid = m_Oracle.IsArenaValidPrinting(entry.m_Name, entry.m_SetCode, entry.m_CollectorNumber);
        if (!is_valid)
        {
            canonical_printing = m_Oracle.GetCanonicalArenaPrinting(entry.m_Name);
        }
    }
    catch (const PrintingOracleError& e)
    {
        LogError("Printing oracle failed to answer: {}", e.what());
        throw with_context(InvalidSetCodeError{
            fmt::format("Printing ({}) {} of '{}' could not be confirmed", entry.m_SetCode, entry.m_CollectorNumber, entry.m_Name),
        });
    }

    if (is_valid)
    {
        return;
    }

    if (!canonical_printing.has_value())
    {
        throw with_context(InvalidSetCodeError{
            fmt::format("'{}' has no printing that can be imported into Arena", entry.m_Name),
        });
    }

    // Set mismatch wins over collector number mismatch
    const Printing& canonical{ canonical_printing.value() };
    if (canonical.m_SetCode != entry.m_SetCode)
    {
        throw with_context(InvalidSetCodeError{
            fmt::format("Printing ({}) {} of '{}' is not available on Arena, try ({}) {}",
                        entry.m_SetCode,
                        entry.m_CollectorNumber,
                        entry.m_Name,
                        canonical.m_SetCode,
                        canonical.m_CollectorNumber),
            canonical,
        });
    }
    if (canonical.m_CollectorNumber != entry.m_CollectorNumber)
    {
        throw with_context(InvalidCollectorNumberError{
            fmt::format("Collector number {} of '{}' is not available on Arena in set {}, try {}",
                        entry.m_CollectorNumber,
                        entry.m_Name,
                        entry.m_SetCode,
                        canonical.m_CollectorNumber),
            canonical,
        });
    }

    // The oracle rejected the printing it calls canonical
    throw with_context(InvalidSetCodeError{
        fmt::format("Printing ({}) {} of '{}' could not be confirmed", entry.m_SetCode, entry.m_CollectorNumber, entry.m_Name),
        canonical,
    });
}

void DeckSanitizer::RejectDuplicates(const std::vector<ValidatedEntry>& entries, std::string_view section_name)
{
    std::set<std::tuple<std::string_view, std::string_view, std::string_view>> seen_printings;
    for (const ValidatedEntry& entry : entries)
    {
        const bool inserted{
            seen_printings.emplace(entry.m_Name, entry.m_SetCode, entry.m_CollectorNumber).second
        };
        if (!inserted)
        {
            DuplicateCardError error{ entry.m_Name, section_name };
            if (entry.m_LineNumber.has_value())
            {
                error.SetLineNumber(entry.m_LineNumber.value());
            }
            throw error;
        }
    }
}

std::vector<DeckSanitizer::ValidatedEntry> DeckSanitizer::ResolveCardCounts(std::span<const CardCount> card_counts,
                                                                            std::string_view section_name) const
{
    std::set<std::string> seen_names;
    std::vector<ValidatedEntry> entries;
    entries.reserve(card_counts.size());
    for (const CardCount& card_count : card_counts)
    {
        const uint32_t quantity{ ValidateQuantity(QString::number(card_count.m_Quantity)) };
        std::string name{ ValidateCardName(ToQString(card_count.m_Name)) };

        if (!seen_names.insert(name).second)
        {
            throw DuplicateCardError{ std::move(name), section_name };
        }

        std::optional<Printing> canonical_printing{};
        try
        {
            canonical_printing = m_Oracle.GetCanonicalArenaPrinting(name);
        }
        catch (const PrintingOracleError& e)
        {
            LogError("Printing oracle failed to answer: {}", e.what());
            InvalidSetCodeError error{ fmt::format("Printing of '{}' could not be confirmed", name) };
            error.SetCardName(std::move(name));
            throw error;
        }

        if (!canonical_printing.has_value())
        {
            InvalidCardNameError error{ fmt::format("'{}' has no printing that can be imported into Arena", name) };
            error.SetCardName(std::move(name));
            throw error;
        }

        // Oracle data is not trusted any more than deck text
        std::string set_code{ ValidateSetCode(ToQString(canonical_printing->m_SetCode)) };
        std::string collector_number{ ValidateCollectorNumber(ToQString(canonical_printing->m_CollectorNumber)) };

        entries.push_back(ValidatedEntry{
            .m_Quantity = quantity,
            .m_Name{ std::move(name) },
            .m_SetCode{ std::move(set_code) },
            .m_CollectorNumber{ std::move(collector_number) },
            .m_LineNumber{},
        });
    }
    return entries;
}

std::vector<SanitizedCard> DeckSanitizer::ToCards(std::vector<ValidatedEntry> entries)
{
    std::vector<SanitizedCard> cards;
    cards.reserve(entries.size());
    for (ValidatedEntry& entry : entries)
    {
        cards.push_back(SanitizedCard{
            entry.m_Quantity,
            std::move(entry.m_Name),
            std::move(entry.m_SetCode),
            std::move(entry.m_CollectorNumber),
        });
    }
    return cards;
}

SanitizedDeck SanitizeDeckForArena(const QString& raw_deck, const PrintingOracle& oracle)
{
    return DeckSanitizer{ oracle }.Sanitize(raw_deck);
}

SanitizedDeck SanitizeCardCounts(std::span<const CardCount> mainboard,
                                 std::span<const CardCount> sideboard,
                                 const PrintingOracle& oracle)
{
    return DeckSanitizer{ oracle }.SanitizeCardCounts(mainboard, sideboard);
}
