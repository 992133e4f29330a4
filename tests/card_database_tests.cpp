#include <catch2/catch_test_macros.hpp>

#include <fstream>

#include <nlohmann/json.hpp>

#include <ads/deck/card_database.hpp>
#include <ads/deck/errors.hpp>
#include <ads/util/at_scope_exit.hpp>

#include "test_oracle.hpp"

TEST_CASE("Load card database from json", "[card_database_json]")
{
    const auto json{ nlohmann::json::parse(R"(
{
    "version": "ADS00001",
    "cards": [
        {
            "name": "Lightning Bolt",
            "arena_id": 68,
            "rarity": "common",
            "printings": [
                { "set": "plst", "collector_number": "M10-146" },
                { "set": "sta", "collector_number": "42" },
                { "set": "m10", "collector_number": "146" }
            ]
        },
        {
            "name": "Counterspell",
            "arena_id": null,
            "rarity": "common",
            "printings": [
                { "set": "mh2", "collector_number": "267" }
            ]
        },
        {
            "name": "Duress",
            "printings": [
                { "set": "sta", "collector_number": "28" }
            ]
        }
    ]
}
)") };

    const CardDatabase database{ CardDatabase::FromJson(json) };
    REQUIRE(database.Size() == 3);

    // Set codes are normalized to upper case
    REQUIRE(database.IsArenaValidPrinting("Lightning Bolt", "M10", "146"));
    REQUIRE(database.IsArenaValidPrinting("Lightning Bolt", "STA", "42"));
    REQUIRE_FALSE(database.IsArenaValidPrinting("Lightning Bolt", "PLST", "M10-146"));
    REQUIRE_FALSE(database.IsArenaValidPrinting("Lightning Bolt", "M10", "147"));
    REQUIRE(database.GetCanonicalArenaPrinting("Lightning Bolt") == Printing{ "STA", "42" });

    REQUIRE_FALSE(database.IsArenaValidPrinting("Counterspell", "MH2", "267"));
    REQUIRE_FALSE(database.GetCanonicalArenaPrinting("Counterspell").has_value());
    REQUIRE_FALSE(database.GetCanonicalArenaPrinting("Duress").has_value());

    const auto card{ database.FindCard("Lightning Bolt") };
    REQUIRE(card.has_value());
    REQUIRE(card->m_ArenaId == 68u);
    REQUIRE(card->m_Rarity == "common");
    REQUIRE(card->m_Printings.size() == 3);
}

TEST_CASE("Reject card databases of a different version", "[card_database_version]")
{
    const auto json{ nlohmann::json::parse(R"({ "version": "ADS00000", "cards": [] })") };
    REQUIRE_THROWS_AS(CardDatabase::FromJson(json), CardDatabaseError);

    const auto no_version{ nlohmann::json::parse(R"({ "cards": [] })") };
    REQUIRE_THROWS_AS(CardDatabase::FromJson(no_version), CardDatabaseError);
}

TEST_CASE("Reject malformed card databases", "[card_database_malformed]")
{
    const auto no_cards{ nlohmann::json::parse(R"({ "version": "ADS00001" })") };
    REQUIRE_THROWS_AS(CardDatabase::FromJson(no_cards), CardDatabaseError);

    const auto no_printings{ nlohmann::json::parse(R"({ "version": "ADS00001", "cards": [ { "name": "Duress" } ] })") };
    REQUIRE_THROWS_AS(CardDatabase::FromJson(no_printings), CardDatabaseError);
}

TEST_CASE("Load card database from file", "[card_database_file]")
{
    REQUIRE_THROWS_AS(CardDatabase::FromFile("does_not_exist.json"), CardDatabaseError);

    AtScopeExit delete_files{
        []()
        {
            std::filesystem::remove("card_database_test.json");
            std::filesystem::remove("card_database_broken.json");
        }
    };

    {
        std::ofstream file{ "card_database_test.json" };
        file << R"({ "version": "ADS00001", "cards": [ { "name": "Forest", "arena_id": 1, "printings": [ { "set": "anb", "collector_number": "114" } ] } ] })";
    }
    const CardDatabase database{ CardDatabase::FromFile("card_database_test.json") };
    REQUIRE(database.IsArenaValidPrinting("Forest", "ANB", "114"));

    {
        std::ofstream file{ "card_database_broken.json" };
        file << R"({ "version": "ADS00001", "cards": [ )";
    }
    REQUIRE_THROWS_AS(CardDatabase::FromFile("card_database_broken.json"), CardDatabaseError);
}

TEST_CASE("Refresh card database", "[card_database_refresh]")
{
    CardDatabase database{ MakeTestCardDatabase() };
    REQUIRE(database.IsArenaValidPrinting("Forest", "ANB", "114"));

    REQUIRE(database.RemoveCard("Forest"));
    REQUIRE_FALSE(database.RemoveCard("Forest"));
    REQUIRE_FALSE(database.IsArenaValidPrinting("Forest", "ANB", "114"));

    database.Replace({});
    REQUIRE(database.Size() == 0);
    REQUIRE_FALSE(database.GetCanonicalArenaPrinting("Lightning Bolt").has_value());
}
