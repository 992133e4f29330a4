#include <catch2/catch_test_macros.hpp>

#include <QString>

#include <ads/constants.hpp>
#include <ads/deck/errors.hpp>
#include <ads/deck/field_validators.hpp>

TEST_CASE("Validate quantity bounds", "[validate_quantity]")
{
    REQUIRE(ValidateQuantity("1") == c_MinCardQuantity);
    REQUIRE(ValidateQuantity("4") == 4);
    REQUIRE(ValidateQuantity("250") == c_MaxCardQuantity);
    REQUIRE(ValidateQuantity("007") == 7);
    REQUIRE(ValidateQuantity("0000000004") == 4);
    REQUIRE(ValidateQuantity("00000000000000000250") == c_MaxCardQuantity);

    REQUIRE_THROWS_AS(ValidateQuantity("0"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("251"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("99999999"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("99999999999999999999"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("0000000000"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("0001000000000"), InvalidQuantityError);
}

TEST_CASE("Validate quantity format", "[validate_quantity_format]")
{
    REQUIRE_THROWS_AS(ValidateQuantity(""), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("-1"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("+4"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("4x"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("four"), InvalidQuantityError);
    REQUIRE_THROWS_AS(ValidateQuantity("4.0"), InvalidQuantityError);
    // Arabic-Indic digit four
    REQUIRE_THROWS_AS(ValidateQuantity(QString::fromUtf8("٤")), InvalidQuantityError);
}

TEST_CASE("Validate card names", "[validate_card_name]")
{
    REQUIRE(ValidateCardName("Lightning Bolt") == "Lightning Bolt");
    REQUIRE(ValidateCardName("Fire // Ice") == "Fire // Ice");
    REQUIRE(ValidateCardName("Jin-Gitaxias, Progress Tyrant") == "Jin-Gitaxias, Progress Tyrant");
    REQUIRE(ValidateCardName("Ach! Hans, Run!") == "Ach! Hans, Run!");
    REQUIRE(ValidateCardName("Borrowing 100,000 Arrows") == "Borrowing 100,000 Arrows");
    REQUIRE(ValidateCardName(QString::fromUtf8("Lim-Dûl's Vault")) == "Lim-Dûl's Vault");
    REQUIRE(ValidateCardName("A") == "A");
}

TEST_CASE("Validate card name length", "[validate_card_name_length]")
{
    const QString longest_name{ static_cast<qsizetype>(c_MaxCardNameLength), QChar{ u'A' } };
    REQUIRE(ValidateCardName(longest_name).size() == c_MaxCardNameLength);

    const QString too_long_name{ static_cast<qsizetype>(c_MaxCardNameLength + 1), QChar{ u'A' } };
    REQUIRE_THROWS_AS(ValidateCardName(too_long_name), InvalidCardNameError);
}

TEST_CASE("Reject hostile card names", "[validate_card_name_hostile]")
{
    REQUIRE_THROWS_AS(ValidateCardName(""), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("   "), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName(" Lightning Bolt"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning Bolt "), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning  Bolt"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning\tBolt"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning\x07"
                                       "Bolt"),
                      InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName(QString{ "Lightning" } + QChar{ u'\0' } + "Bolt"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning (Bolt"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Lightning Bolt)"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("../../etc/passwd"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("<script>alert(1)</script>"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Bolt; DROP TABLE cards"), InvalidCardNameError);
    REQUIRE_THROWS_AS(ValidateCardName("Bolt\\Bolt"), InvalidCardNameError);
    // Right-to-left override
    REQUIRE_THROWS_AS(ValidateCardName(QString{ "Bolt" } + QChar{ 0x202E } + "tlob"), InvalidCardNameError);
}

TEST_CASE("Validate set codes", "[validate_set_code]")
{
    REQUIRE(ValidateSetCode("M10") == "M10");
    REQUIRE(ValidateSetCode("STA") == "STA");
    REQUIRE(ValidateSetCode("MH2") == "MH2");
    REQUIRE(ValidateSetCode("YMID") == "YMID");
    REQUIRE(ValidateSetCode("ABCDEF") == "ABCDEF");

    REQUIRE_THROWS_AS(ValidateSetCode(""), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("ABCDEFG"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("m10"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("M-10"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("M 10"), InvalidSetCodeError);
}

TEST_CASE("Reject set codes Arena can not import", "[validate_set_code_arena]")
{
    REQUIRE_THROWS_AS(ValidateSetCode("PLST"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("SLD"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("MUL"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("WC97"), InvalidSetCodeError);
    REQUIRE_THROWS_AS(ValidateSetCode("30A"), InvalidSetCodeError);

    REQUIRE(IsArenaInvalidSet("plst"));
    REQUIRE(IsArenaInvalidSet("PlSt"));
    REQUIRE_FALSE(IsArenaInvalidSet("M10"));
}

TEST_CASE("Validate collector numbers", "[validate_collector_number]")
{
    REQUIRE(ValidateCollectorNumber("146") == "146");
    REQUIRE(ValidateCollectorNumber("39p") == "39p");
    REQUIRE(ValidateCollectorNumber("ODY-185") == "ODY-185");
    REQUIRE(ValidateCollectorNumber(QString::fromUtf8("63★")) == "63★");
    REQUIRE(ValidateCollectorNumber(QString::fromUtf8("12†")) == "12†");
    REQUIRE(ValidateCollectorNumber("1234567890") == "1234567890");

    REQUIRE_THROWS_AS(ValidateCollectorNumber(""), InvalidCollectorNumberError);
    REQUIRE_THROWS_AS(ValidateCollectorNumber("12345678901"), InvalidCollectorNumberError);
    REQUIRE_THROWS_AS(ValidateCollectorNumber("abc"), InvalidCollectorNumberError);
    REQUIRE_THROWS_AS(ValidateCollectorNumber("?"), InvalidCollectorNumberError);
    REQUIRE_THROWS_AS(ValidateCollectorNumber("14/6"), InvalidCollectorNumberError);
    REQUIRE_THROWS_AS(ValidateCollectorNumber("146;"), InvalidCollectorNumberError);
}

TEST_CASE("Validation errors carry their kind", "[validate_error_kind]")
{
    try
    {
        ValidateQuantity("0");
        FAIL("Expected InvalidQuantityError");
    }
    catch (const SanitizationError& e)
    {
        REQUIRE(e.GetKind() == ErrorKind::InvalidQuantity);
        REQUIRE(ErrorKindName(e.GetKind()) == "InvalidQuantity");
        REQUIRE_FALSE(e.GetLineNumber().has_value());
    }
}
