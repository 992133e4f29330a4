#include <ads/deck/field_validators.hpp>

#include <algorithm>
#include <iterator>

#include <QString>

#include <fmt/format.h>

#include <ads/constants.hpp>
#include <ads/deck/errors.hpp>

namespace
{
bool IsAsciiDigit(QChar c)
{
    return c.unicode() >= u'0' && c.unicode() <= u'9';
}

bool IsAsciiUpperOrDigit(QChar c)
{
    return IsAsciiDigit(c) || (c.unicode() >= u'A' && c.unicode() <= u'Z');
}

bool IsAsciiAlphanumeric(QChar c)
{
    return IsAsciiUpperOrDigit(c) || (c.unicode() >= u'a' && c.unicode() <= u'z');
}

bool IsCardNamePunctuation(QChar c)
{
    static constexpr std::u16string_view c_AllowedPunctuation{ u"',-./:!?&\"_+" };
    return c_AllowedPunctuation.contains(c.unicode());
}

bool IsCollectorNumberSymbol(QChar c)
{
    // Variant markers used by Arena, e.g. "★" for foil-only and "†" for misprints
    static constexpr std::u16string_view c_AllowedSymbols{ u"-★†" };
    return c_AllowedSymbols.contains(c.unicode());
}
} // namespace

uint32_t ValidateQuantity(const QString& raw_quantity)
{
    if (raw_quantity.isEmpty())
    {
        throw InvalidQuantityError{ "Quantity is empty" };
    }

    if (!std::ranges::all_of(raw_quantity, IsAsciiDigit))
    {
        throw InvalidQuantityError{ "Quantity is not a base-10 integer" };
    }

    // Leading zeros do not change the value, anything longer than this is
    // far above the maximum and would overflow toUInt
    const auto first_significant{
        std::ranges::find_if(raw_quantity,
                             [](QChar c)
                             { return c != u'0'; })
    };
    if (std::distance(first_significant, raw_quantity.end()) > 9)
    {
        throw InvalidQuantityError{
            fmt::format("Quantity exceeds maximum of {}", c_MaxCardQuantity)
        };
    }

    const uint32_t quantity{ raw_quantity.toUInt() };
    if (quantity < c_MinCardQuantity)
    {
        throw InvalidQuantityError{
            fmt::format("Quantity must be at least {}, got {}", c_MinCardQuantity, quantity)
        };
    }
    if (quantity > c_MaxCardQuantity)
    {
        throw InvalidQuantityError{
            fmt::format("Quantity {} exceeds maximum of {}", quantity, c_MaxCardQuantity)
        };
    }

    return quantity;
}

std::string ValidateCardName(const QString& raw_name)
{
    if (raw_name.trimmed().isEmpty())
    {
        throw InvalidCardNameError{ "Card name is empty" };
    }

    if (static_cast<std::size_t>(raw_name.size()) > c_MaxCardNameLength)
    {
        throw InvalidCardNameError{
            fmt::format("Card name exceeds maximum length of {} characters", c_MaxCardNameLength)
        };
    }

    if (raw_name.front().isSpace() || raw_name.back().isSpace())
    {
        throw InvalidCardNameError{ "Card name has leading or trailing whitespace" };
    }

    for (const QChar c : raw_name)
    {
        if (c.category() == QChar::Other_Control)
        {
            throw InvalidCardNameError{ "Card name contains a control character" };
        }
        if (c == u'(' || c == u')')
        {
            throw InvalidCardNameError{ "Card name contains a set code delimiter" };
        }

        const bool is_allowed{
            c.isLetter() || c.isMark() || IsAsciiDigit(c) || c == u' ' || IsCardNamePunctuation(c)
        };
        if (!is_allowed)
        {
            throw InvalidCardNameError{
                fmt::format("Card name contains disallowed character U+{:04X}", static_cast<unsigned>(c.unicode()))
            };
        }
    }

    if (raw_name.contains(QStringLiteral("  ")))
    {
        throw InvalidCardNameError{ "Card name contains consecutive spaces" };
    }
    if (raw_name.contains(QStringLiteral("..")))
    {
        throw InvalidCardNameError{ "Card name contains a path traversal sequence" };
    }

    return raw_name.toStdString();
}

std::string ValidateSetCode(const QString& raw_set_code)
{
    if (raw_set_code.isEmpty())
    {
        throw InvalidSetCodeError{ "Set code is empty" };
    }

    if (static_cast<std::size_t>(raw_set_code.size()) > c_MaxSetCodeLength)
    {
        throw InvalidSetCodeError{
            fmt::format("Set code exceeds maximum length of {} characters", c_MaxSetCodeLength)
        };
    }

    if (!std::ranges::all_of(raw_set_code, IsAsciiUpperOrDigit))
    {
        throw InvalidSetCodeError{ "Set code must be uppercase alphanumeric" };
    }

    std::string set_code{ raw_set_code.toStdString() };
    if (IsArenaInvalidSet(set_code))
    {
        throw InvalidSetCodeError{
            fmt::format("Set code {} can not be imported into Arena", set_code)
        };
    }

    return set_code;
}

std::string ValidateCollectorNumber(const QString& raw_collector_number)
{
    if (raw_collector_number.isEmpty())
    {
        throw InvalidCollectorNumberError{ "Collector number is empty" };
    }

    if (static_cast<std::size_t>(raw_collector_number.size()) > c_MaxCollectorNumberLength)
    {
        throw InvalidCollectorNumberError{
            fmt::format("Collector number exceeds maximum length of {} characters", c_MaxCollectorNumberLength)
        };
    }

    const bool is_allowed{
        std::ranges::all_of(raw_collector_number,
                            [](QChar c)
                            { return IsAsciiAlphanumeric(c) || IsCollectorNumberSymbol(c); })
    };
    if (!is_allowed)
    {
        throw InvalidCollectorNumberError{ "Collector number contains disallowed characters" };
    }

    if (!std::ranges::any_of(raw_collector_number, IsAsciiDigit))
    {
        throw InvalidCollectorNumberError{ "Collector number contains no digit" };
    }

    return raw_collector_number.toStdString();
}
