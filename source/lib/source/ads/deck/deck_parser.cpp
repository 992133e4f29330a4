#include <ads/deck/deck_parser.hpp>

#include <optional>

#include <QRegularExpression>
#include <QStringList>

#include <fmt/format.h>

#include <ads/constants.hpp>
#include <ads/deck/errors.hpp>
#include <ads/qt_util.hpp>

std::size_t ParsedDeck::EntryCount() const
{
    return m_Mainboard.m_Entries.size() + m_Sideboard.m_Entries.size();
}

class ArenaDeckParser
{
  public:
    ParsedDeck Parse(const QString& raw_deck);

  private:
    enum class Section
    {
        None,
        Mainboard,
        Sideboard,
    };

    void EnterSection(Section section, uint32_t line_number);
    static std::optional<ParsedEntry> LineToEntry(const QString& line, uint32_t line_number);

    // <quantity> <name> (<set>) <collector number>
    static inline const QRegularExpression g_Regex{
        R"(^(\S+)\s+(.+?)\s+\(([^()\s]*)\)\s+(\S+)$)"
    };

    Section m_Section{ Section::None };
    ParsedDeck m_Deck{
        .m_Mainboard{ .m_Name = c_MainboardHeader, .m_Entries{} },
        .m_Sideboard{ .m_Name = c_SideboardHeader, .m_Entries{} },
    };
};

template<class FunT>
void ForEachLine(const QString& text, FunT&& fun)
{
    QString normalized{ text };
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n")).replace('\r', '\n');

    const auto lines{ normalized.split('\n') };
    for (qsizetype i = 0; i < lines.size(); i++)
    {
        fun(lines[i].trimmed(), static_cast<uint32_t>(i + 1));
    }
}

ParsedDeck ArenaDeckParser::Parse(const QString& raw_deck)
{
    bool has_content{ false };
    ForEachLine(
        raw_deck,
        [&](const QString& line, uint32_t line_number)
        {
            if (line.isEmpty())
            {
                return;
            }
            has_content = true;

            if (line == ToQString(c_MainboardHeader))
            {
                EnterSection(Section::Mainboard, line_number);
                return;
            }
            if (line == ToQString(c_SideboardHeader))
            {
                EnterSection(Section::Sideboard, line_number);
                return;
            }

            // Keeps the regex away from arbitrarily long lines
            if (static_cast<std::size_t>(line.size()) > c_MaxDeckLineLength)
            {
                throw InvalidDeckStructureError{
                    fmt::format("Line {} exceeds maximum length of {} characters", line_number, c_MaxDeckLineLength),
                    line_number,
                };
            }

            auto entry{ LineToEntry(line, line_number) };
            if (!entry.has_value())
            {
                throw InvalidDeckStructureError{
                    fmt::format("Malformed line {}, expected '<quantity> <name> (<set>) <collector number>'", line_number),
                    line_number,
                };
            }

            if (m_Section == Section::None)
            {
                // Cards before any header belong to the mainboard
                m_Section = Section::Mainboard;
            }

            ParsedSection& section{ m_Section == Section::Sideboard ? m_Deck.m_Sideboard : m_Deck.m_Mainboard };
            section.m_Entries.push_back(std::move(entry).value());
        });

    if (!has_content)
    {
        throw InvalidDeckStructureError{ "Deck list contains no lines" };
    }

    return std::move(m_Deck);
}

void ArenaDeckParser::EnterSection(Section section, uint32_t line_number)
{
    if (section == Section::Mainboard && m_Section != Section::None)
    {
        throw InvalidDeckStructureError{
            m_Section == Section::Mainboard
                ? fmt::format("Duplicate section {} on line {}", c_MainboardHeader, line_number)
                : fmt::format("Section {} after {} on line {}", c_MainboardHeader, c_SideboardHeader, line_number),
            line_number,
        };
    }
    if (section == Section::Sideboard && m_Section == Section::Sideboard)
    {
        throw InvalidDeckStructureError{
            fmt::format("Duplicate section {} on line {}", c_SideboardHeader, line_number),
            line_number,
        };
    }

    m_Section = section;
}

std::optional<ParsedEntry> ArenaDeckParser::LineToEntry(const QString& line, uint32_t line_number)
{
    const auto deckline{ g_Regex.match(line) };
    if (!deckline.hasMatch())
    {
        return std::nullopt;
    }

    return ParsedEntry{
        .m_RawQuantity{ deckline.captured(1) },
        .m_RawName{ deckline.captured(2) },
        .m_RawSetCode{ deckline.captured(3) },
        .m_RawCollectorNumber{ deckline.captured(4) },
        .m_LineNumber = line_number,
    };
}

ParsedDeck ParseDeck(const QString& raw_deck)
{
    return ArenaDeckParser{}.Parse(raw_deck);
}
