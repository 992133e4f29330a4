#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include <QFile>
#include <QString>

#include <ads/config.hpp>
#include <ads/constants.hpp>
#include <ads/deck/card_database.hpp>
#include <ads/deck/deck_renderer.hpp>
#include <ads/deck/deck_sanitizer.hpp>
#include <ads/deck/errors.hpp>
#include <ads/deck/export_validator.hpp>
#include <ads/qt_util.hpp>
#include <ads/util/log.hpp>
#include <ads/version.hpp>

enum ExitCode : int
{
    c_ExitSuccess = 0,
    c_ExitSanitizationError = 1,
    c_ExitExportError = 2,
    c_ExitIoError = 3,
    c_ExitUsageError = 4,
};

struct CommandLineOptions
{
    bool m_HelpDisplayed{ false };
    bool m_VersionDisplayed{ false };
    bool m_UsageError{ false };

    std::optional<std::string> m_ConfigFile{ std::nullopt };
    std::optional<std::string> m_CardsFile{ std::nullopt };
    std::optional<std::string> m_DeckFile{ std::nullopt };
};

constexpr const char c_HelpStr[]{
    R"(
Command Line Interface for Arena-Deck-Sanitizer

Reads an Arena deck list, validates every card against the card database
and prints the deck as Arena import text.

    --help              Display this information.
    --version           Display the version of this program.
    --config <ini>      Read settings from this file instead of config.ini.
    --cards <json>      Load the card database from this file, overrides
                        Card.Database from the config.
    --deck <file>       Read the deck list from this file instead of stdin.

Exit codes:
    0                   Deck is valid, rendered deck written to stdout.
    1                   Deck was rejected while sanitizing.
    2                   Deck failed validation right before export.
    3                   Card database or deck file could not be read.
    4                   Invalid command line.
)"
};

CommandLineOptions ParseCommandLine(int argc, char** raw_argv)
{
    using namespace std::string_view_literals;

    std::span argv{ raw_argv, static_cast<size_t>(argc) };

    CommandLineOptions cli;

    if (std::ranges::contains(argv, "--help"sv))
    {
        fmt::print("{}", c_HelpStr);
        cli.m_HelpDisplayed = true;
        return cli;
    }
    if (std::ranges::contains(argv, "--version"sv))
    {
        fmt::print("Arena-Deck-Sanitizer {} built {}\n", DeckSanitizerVersion(), DeckSanitizerBuildTime());
        cli.m_VersionDisplayed = true;
        return cli;
    }

    const auto take_param{
        [&](size_t& i, std::optional<std::string>& target)
        {
            if (i + 1 >= argv.size())
            {
                fmt::print(stderr, "Missing value for command line option {}\n", argv[i]);
                cli.m_UsageError = true;
                return;
            }

            ++i;
            target = argv[i];
        }
    };

    for (size_t i = 1; i < argv.size() && !cli.m_UsageError; i++)
    {
        const std::string_view arg{ argv[i] };
        if (arg == "--config")
        {
            take_param(i, cli.m_ConfigFile);
        }
        else if (arg == "--cards")
        {
            take_param(i, cli.m_CardsFile);
        }
        else if (arg == "--deck")
        {
            take_param(i, cli.m_DeckFile);
        }
        else
        {
            fmt::print(stderr, "Unknown command line option {}\n", arg);
            cli.m_UsageError = true;
        }
    }

    return cli;
}

std::optional<QString> ReadDeckText(const std::optional<std::string>& deck_file)
{
    // Enough bytes to hold any deck list that is not too long, everything
    // beyond still decodes to a text the sanitizer rejects for its length
    static constexpr qint64 c_MaxDeckBytes{ static_cast<qint64>(c_MaxDeckTextLength) * 4 + 4 };

    QFile file;
    bool opened{ false };
    if (deck_file.has_value())
    {
        file.setFileName(ToQString(deck_file.value()));
        opened = file.open(QFile::ReadOnly);
    }
    else
    {
        opened = file.open(stdin, QFile::ReadOnly);
    }

    if (!opened)
    {
        LogError("Could not open deck list {}", deck_file.value_or("<stdin>"));
        return std::nullopt;
    }

    return QString::fromUtf8(file.read(c_MaxDeckBytes));
}

template<class ErrorT>
void PrintError(const ErrorT& error)
{
    fmt::print(stderr, "{}: {}\n", ErrorKindName(error.GetKind()), error.what());
}

int main(int argc, char** argv)
{
    const CommandLineOptions cli{ ParseCommandLine(argc, argv) };
    if (cli.m_UsageError)
    {
        fmt::print(stderr, "{}", c_HelpStr);
        return c_ExitUsageError;
    }
    if (cli.m_HelpDisplayed || cli.m_VersionDisplayed)
    {
        return c_ExitSuccess;
    }

    const Config config{ LoadConfig(cli.m_ConfigFile.value_or(std::string{ Config::c_DefaultConfigFile })) };

    LogFlags log_flags{ LogFlags::Console };
    if (config.m_LogToFile)
    {
        log_flags |= LogFlags::File;
    }
    if (config.m_LogDetails)
    {
        log_flags |= LogFlags::DetailFile | LogFlags::DetailLine | LogFlags::DetailFunction;
    }
    Log main_log{ log_flags, Log::c_MainLogName, config.m_LogLevel };

    const std::filesystem::path card_database_path{
        cli.m_CardsFile.has_value()
            ? std::filesystem::path{ cli.m_CardsFile.value() }
            : config.m_CardDatabasePath
    };

    try
    {
        const CardDatabase card_database{ CardDatabase::FromFile(card_database_path) };

        const auto raw_deck{ ReadDeckText(cli.m_DeckFile) };
        if (!raw_deck.has_value())
        {
            return c_ExitIoError;
        }

        const SanitizedDeck deck{ SanitizeDeckForArena(raw_deck.value(), card_database) };
        ValidateArenaExport(deck, card_database);

        fmt::print("{}\n", FormatDeckForArena(deck));
        return c_ExitSuccess;
    }
    catch (const SanitizationError& e)
    {
        PrintError(e);
        if (e.GetLineNumber().has_value())
        {
            fmt::print(stderr, "    on line {}\n", e.GetLineNumber().value());
        }
        return c_ExitSanitizationError;
    }
    catch (const ArenaImportabilityError& e)
    {
        PrintError(e);
        return c_ExitExportError;
    }
    catch (const CardDatabaseError& e)
    {
        PrintError(e);
        return c_ExitIoError;
    }
}
