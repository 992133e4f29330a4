#include <ads/deck/card_database.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <ranges>

#include <nlohmann/json.hpp>

#include <ads/constants.hpp>
#include <ads/deck/errors.hpp>
#include <ads/util/log.hpp>
#include <ads/version.hpp>

namespace
{
std::string ToUpper(std::string str)
{
    std::ranges::transform(str,
                           str.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
    return str;
}
} // namespace

// NOLINTNEXTLINE
void from_json(const nlohmann::json& json, Printing& printing)
{
    printing.m_SetCode = ToUpper(json.at("set").get<std::string>());
    printing.m_CollectorNumber = json.at("collector_number").get<std::string>();
}

// NOLINTNEXTLINE
void from_json(const nlohmann::json& json, CardRecord& card)
{
    card.m_Name = json.at("name").get<std::string>();
    if (json.contains("arena_id") && !json["arena_id"].is_null())
    {
        card.m_ArenaId = json["arena_id"].get<uint32_t>();
    }
    card.m_Rarity = json.value("rarity", std::string{});
    card.m_Printings = json.at("printings").get<std::vector<Printing>>();
}

CardDatabase::CardDatabase(std::vector<CardRecord> cards)
{
    Replace(std::move(cards));
}

CardDatabase CardDatabase::FromFile(const std::filesystem::path& path)
{
    std::ifstream file{ path };
    if (!file)
    {
        throw CardDatabaseError{ fmt::format("Could not open card database {}", path.string()) };
    }

    nlohmann::json json;
    try
    {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw CardDatabaseError{ fmt::format("Card database {} is not valid json: {}", path.string(), e.what()) };
    }

    LogInfo("Loading card database from {}", path.string());
    return FromJson(json);
}

CardDatabase CardDatabase::FromJson(const nlohmann::json& json)
{
    if (!json.is_object() || !json.contains("version") || !json["version"].is_string() || json["version"].get_ref<const std::string&>() != CardDatabaseFormatVersion())
    {
        throw CardDatabaseError{ "Card database version not compatible with this version..." };
    }

    try
    {
        return CardDatabase{ json.at("cards").get<std::vector<CardRecord>>() };
    }
    catch (const nlohmann::json::exception& e)
    {
        throw CardDatabaseError{ fmt::format("Malformed card database: {}", e.what()) };
    }
}

void CardDatabase::AddCard(CardRecord card)
{
    std::unique_lock lock{ m_Mutex };
    std::string name{ card.m_Name };
    m_Cards.insert_or_assign(std::move(name), std::move(card));
}

bool CardDatabase::RemoveCard(std::string_view name)
{
    std::unique_lock lock{ m_Mutex };
    return m_Cards.erase(std::string{ name }) > 0;
}

void CardDatabase::Replace(std::vector<CardRecord> cards)
{
    CardMap new_cards;
    for (CardRecord& card : cards)
    {
        std::string name{ card.m_Name };
        new_cards.insert_or_assign(std::move(name), std::move(card));
    }

    std::unique_lock lock{ m_Mutex };
    m_Cards = std::move(new_cards);
    LogDebug("Card database holds {} cards", m_Cards.size());
}

std::optional<CardRecord> CardDatabase::FindCard(std::string_view name) const
{
    std::shared_lock lock{ m_Mutex };
    auto it = m_Cards.find(std::string{ name });
    if (it != m_Cards.end())
        return it->second;
    return std::nullopt;
}

std::size_t CardDatabase::Size() const
{
    std::shared_lock lock{ m_Mutex };
    return m_Cards.size();
}

bool CardDatabase::IsArenaValidPrinting(std::string_view name,
                                        std::string_view set_code,
                                        std::string_view collector_number) const
{
    std::shared_lock lock{ m_Mutex };
    auto it = m_Cards.find(std::string{ name });
    if (it == m_Cards.end())
    {
        return false;
    }

    const CardRecord& card{ it->second };
    return std::ranges::any_of(card.m_Printings,
                               [&](const Printing& printing)
                               {
                                   return printing.m_SetCode == set_code &&
                                          printing.m_CollectorNumber == collector_number &&
                                          IsImportable(card, printing);
                               });
}

std::optional<Printing> CardDatabase::GetCanonicalArenaPrinting(std::string_view name) const
{
    std::shared_lock lock{ m_Mutex };
    auto it = m_Cards.find(std::string{ name });
    if (it == m_Cards.end())
    {
        return std::nullopt;
    }

    const CardRecord& card{ it->second };
    auto canonical = std::ranges::find_if(card.m_Printings,
                                          [&](const Printing& printing)
                                          { return IsImportable(card, printing); });
    if (canonical != card.m_Printings.end())
        return *canonical;
    return std::nullopt;
}

bool CardDatabase::IsImportable(const CardRecord& card, const Printing& printing)
{
    return card.m_ArenaId.has_value() && !IsArenaInvalidSet(printing.m_SetCode);
}
