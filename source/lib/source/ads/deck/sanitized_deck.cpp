#include <ads/deck/sanitized_deck.hpp>

#include <utility>

SanitizedCard::SanitizedCard(uint32_t quantity, std::string name, std::string set_code, std::string collector_number)
    : m_Quantity{ quantity }
    , m_Name{ std::move(name) }
    , m_SetCode{ std::move(set_code) }
    , m_CollectorNumber{ std::move(collector_number) }
{
}

uint32_t SanitizedCard::GetQuantity() const
{
    return m_Quantity;
}
const std::string& SanitizedCard::GetName() const
{
    return m_Name;
}
const std::string& SanitizedCard::GetSetCode() const
{
    return m_SetCode;
}
const std::string& SanitizedCard::GetCollectorNumber() const
{
    return m_CollectorNumber;
}

SanitizedDeck::SanitizedDeck(std::vector<SanitizedCard> cards, std::vector<SanitizedCard> sideboard)
    : m_Cards{ std::move(cards) }
    , m_Sideboard{ std::move(sideboard) }
{
}

const std::vector<SanitizedCard>& SanitizedDeck::GetCards() const
{
    return m_Cards;
}
const std::vector<SanitizedCard>& SanitizedDeck::GetSideboard() const
{
    return m_Sideboard;
}
