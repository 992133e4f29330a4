#include <ads/deck/deck_renderer.hpp>

#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ads/constants.hpp>
#include <ads/deck/sanitized_deck.hpp>

namespace
{
void AppendCardLines(std::vector<std::string>& lines, const std::vector<SanitizedCard>& cards)
{
    for (const SanitizedCard& card : cards)
    {
        lines.push_back(fmt::format("{} {} ({}) {}",
                                    card.GetQuantity(),
                                    card.GetName(),
                                    card.GetSetCode(),
                                    card.GetCollectorNumber()));
    }
}
} // namespace

std::string FormatDeckForArena(const SanitizedDeck& deck)
{
    std::vector<std::string> lines;
    lines.reserve(deck.GetCards().size() + deck.GetSideboard().size() + 3);

    lines.emplace_back(c_MainboardHeader);
    AppendCardLines(lines, deck.GetCards());

    if (!deck.GetSideboard().empty())
    {
        lines.emplace_back();
        lines.emplace_back(c_SideboardHeader);
        AppendCardLines(lines, deck.GetSideboard());
    }

    return fmt::format("{}", fmt::join(lines, "\n"));
}
