#pragma once

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <ads/deck/card_database.hpp>
#include <ads/deck/errors.hpp>

inline CardDatabase MakeTestCardDatabase()
{
    return CardDatabase{ std::vector<CardRecord>{
        CardRecord{
            .m_Name{ "Lightning Bolt" },
            .m_ArenaId{ 1 },
            .m_Rarity{ "common" },
            .m_Printings{
                Printing{ "M10", "146" },
                Printing{ "STA", "42" },
                Printing{ "PLST", "M10-146" },
            },
        },
        CardRecord{
            .m_Name{ "Duress" },
            .m_ArenaId{ 2 },
            .m_Rarity{ "common" },
            .m_Printings{
                Printing{ "STA", "28" },
                Printing{ "M19", "94" },
            },
        },
        CardRecord{
            .m_Name{ "Fire // Ice" },
            .m_ArenaId{ 3 },
            .m_Rarity{ "uncommon" },
            .m_Printings{
                Printing{ "MH2", "290" },
            },
        },
        CardRecord{
            .m_Name{ "Llanowar Elves" },
            .m_ArenaId{ 4 },
            .m_Rarity{ "common" },
            .m_Printings{
                Printing{ "PLST", "DOM-168" },
                Printing{ "DOM", "168" },
            },
        },
        CardRecord{
            .m_Name{ "Lim-Dûl's Vault" },
            .m_ArenaId{ 5 },
            .m_Rarity{ "uncommon" },
            .m_Printings{
                Printing{ "EMA", "206" },
            },
        },
        CardRecord{
            .m_Name{ "Forest" },
            .m_ArenaId{ 6 },
            .m_Rarity{ "common" },
            .m_Printings{
                Printing{ "ANB", "114" },
                Printing{ "SLD", "63★" },
            },
        },
        CardRecord{
            .m_Name{ "Brazen Borrower" },
            .m_ArenaId{ 7 },
            .m_Rarity{ "mythic" },
            .m_Printings{
                Printing{ "ELD", "39" },
                Printing{ "ELD", "39p" },
            },
        },
        // Paper only
        CardRecord{
            .m_Name{ "Counterspell" },
            .m_ArenaId{},
            .m_Rarity{ "common" },
            .m_Printings{
                Printing{ "MH2", "267" },
            },
        },
    } };
}

// Stands in for an oracle whose backend is unreachable
class FailingOracle final : public PrintingOracle
{
  public:
    virtual bool IsArenaValidPrinting(std::string_view, std::string_view, std::string_view) const override
    {
        throw PrintingOracleError{ "Card service unreachable" };
    }
    virtual std::optional<Printing> GetCanonicalArenaPrinting(std::string_view) const override
    {
        throw PrintingOracleError{ "Card service unreachable" };
    }
};

// Confirms every printing it is asked about
class AcceptingOracle final : public PrintingOracle
{
  public:
    virtual bool IsArenaValidPrinting(std::string_view, std::string_view, std::string_view) const override
    {
        return true;
    }
    virtual std::optional<Printing> GetCanonicalArenaPrinting(std::string_view) const override
    {
        return std::nullopt;
    }
};

// Confirms nothing, but still names a canonical printing for every card
class RejectingOracle final : public PrintingOracle
{
  public:
    RejectingOracle(std::optional<Printing> canonical_printing)
        : m_CanonicalPrinting{ std::move(canonical_printing) }
    {
    }

    virtual bool IsArenaValidPrinting(std::string_view, std::string_view, std::string_view) const override
    {
        return false;
    }
    virtual std::optional<Printing> GetCanonicalArenaPrinting(std::string_view) const override
    {
        return m_CanonicalPrinting;
    }

  private:
    std::optional<Printing> m_CanonicalPrinting;
};
