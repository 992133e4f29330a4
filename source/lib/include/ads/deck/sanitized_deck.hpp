#pragma once

#include <cstdint>
#include <string>
#include <vector>

/*
        A single card line that passed sanitization, every field satisfies its invariants
        and the printing was confirmed by a PrintingOracle at construction time
*/
class SanitizedCard
{
  public:
    uint32_t GetQuantity() const;
    const std::string& GetName() const;
    const std::string& GetSetCode() const;
    const std::string& GetCollectorNumber() const;

    bool operator==(const SanitizedCard&) const = default;

  private:
    friend class DeckSanitizer;

    SanitizedCard(uint32_t quantity, std::string name, std::string set_code, std::string collector_number);

    uint32_t m_Quantity;
    std::string m_Name;
    std::string m_SetCode;
    std::string m_CollectorNumber;
};

/*
        Immutable deck, only DeckSanitizer can create one
        Cards keep the order in which they appeared in the source
*/
class SanitizedDeck
{
  public:
    const std::vector<SanitizedCard>& GetCards() const;
    const std::vector<SanitizedCard>& GetSideboard() const;

    bool operator==(const SanitizedDeck&) const = default;

  private:
    friend class DeckSanitizer;

    SanitizedDeck(std::vector<SanitizedCard> cards, std::vector<SanitizedCard> sideboard);

    std::vector<SanitizedCard> m_Cards;
    std::vector<SanitizedCard> m_Sideboard;
};
