#include <ads/deck/export_validator.hpp>

#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <ads/constants.hpp>
#include <ads/deck/errors.hpp>
#include <ads/deck/printing_oracle.hpp>
#include <ads/deck/sanitized_deck.hpp>
#include <ads/util/log.hpp>

namespace
{
void ValidateSection(const std::vector<SanitizedCard>& cards, std::string_view section_name, const PrintingOracle& oracle)
{
    for (const SanitizedCard& card : cards)
    {
        if (IsArenaInvalidSet(card.GetSetCode()))
        {
            throw ArenaImportabilityError{
                fmt::format("{}: set {} of '{}' can not be imported into Arena", section_name, card.GetSetCode(), card.GetName()),
                card.GetName(),
            };
        }

        bool is_valid{ false };
        try
        {
            is_valid = oracle.IsArenaValidPrinting(card.GetName(), card.GetSetCode(), card.GetCollectorNumber());
        }
        catch (const PrintingOracleError& e)
        {
            throw ArenaImportabilityError{
                fmt::format("{}: printing of '{}' could not be confirmed: {}", section_name, card.GetName(), e.what()),
                card.GetName(),
            };
        }

        if (!is_valid)
        {
            throw ArenaImportabilityError{
                fmt::format("{}: printing ({}) {} of '{}' is no longer available on Arena",
                            section_name,
                            card.GetSetCode(),
                            card.GetCollectorNumber(),
                            card.GetName()),
                card.GetName(),
            };
        }
    }
}
} // namespace

void ValidateArenaExport(const SanitizedDeck& deck, const PrintingOracle& oracle)
{
    try
    {
        if (deck.GetCards().empty())
        {
            throw ArenaImportabilityError{ "Deck has no mainboard cards" };
        }

        ValidateSection(deck.GetCards(), c_MainboardHeader, oracle);
        ValidateSection(deck.GetSideboard(), c_SideboardHeader, oracle);
    }
    catch (const ArenaImportabilityError& e)
    {
        LogWarning("Deck failed export validation: {}", e.what());
        throw;
    }
}
