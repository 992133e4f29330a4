#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <ads/deck/printing_oracle.hpp>

struct CardRecord
{
    std::string m_Name;
    // Set only for cards available on Arena
    std::optional<uint32_t> m_ArenaId;
    std::string m_Rarity;
    // Ordered, the first importable printing is the canonical one
    std::vector<Printing> m_Printings;
};

/*
        In-memory card table keyed by name, answering printing queries for the sanitizer
        Lookups may run concurrently with a refresh of the table
*/
class CardDatabase final : public PrintingOracle
{
  public:
    CardDatabase() = default;
    CardDatabase(std::vector<CardRecord> cards);

    // Throws CardDatabaseError if the file can not be read, is malformed or of a different version
    static CardDatabase FromFile(const std::filesystem::path& path);
    static CardDatabase FromJson(const nlohmann::json& json);

    void AddCard(CardRecord card);
    bool RemoveCard(std::string_view name);
    void Replace(std::vector<CardRecord> cards);

    std::optional<CardRecord> FindCard(std::string_view name) const;
    std::size_t Size() const;

    virtual bool IsArenaValidPrinting(std::string_view name,
                                      std::string_view set_code,
                                      std::string_view collector_number) const override;
    virtual std::optional<Printing> GetCanonicalArenaPrinting(std::string_view name) const override;

  private:
    using CardMap = std::unordered_map<std::string, CardRecord>;

    static bool IsImportable(const CardRecord& card, const Printing& printing);

    mutable std::shared_mutex m_Mutex;
    CardMap m_Cards;
};
