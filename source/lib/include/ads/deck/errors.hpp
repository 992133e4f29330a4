#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <ads/deck/printing.hpp>

enum class ErrorKind
{
    InvalidDeckStructure,
    InvalidQuantity,
    InvalidCardName,
    InvalidSetCode,
    InvalidCollectorNumber,
    DuplicateCard,
    ArenaImportability,
    PrintingOracle,
    CardDatabase,
};

std::string_view ErrorKindName(ErrorKind kind);

/*
        Root of every error raised while turning untrusted deck text into a SanitizedDeck
        Every one of them is fatal to the sanitize call that raised it
*/
class SanitizationError : public std::runtime_error
{
  public:
    ErrorKind GetKind() const;
    const std::string& GetReason() const;

    // 1-based line of the offending entry in the source text, if the error stems from one
    std::optional<uint32_t> GetLineNumber() const;
    void SetLineNumber(uint32_t line_number);

    const std::optional<std::string>& GetCardName() const;
    void SetCardName(std::string card_name);

  protected:
    SanitizationError(ErrorKind kind, std::string reason);

  private:
    ErrorKind m_Kind;
    std::string m_Reason;
    std::optional<uint32_t> m_LineNumber;
    std::optional<std::string> m_CardName;
};

class InvalidDeckStructureError : public SanitizationError
{
  public:
    InvalidDeckStructureError(std::string reason, std::optional<uint32_t> line_number = std::nullopt);
};

class InvalidQuantityError : public SanitizationError
{
  public:
    InvalidQuantityError(std::string reason);
};

class InvalidCardNameError : public SanitizationError
{
  public:
    InvalidCardNameError(std::string reason);
};

class InvalidSetCodeError : public SanitizationError
{
  public:
    InvalidSetCodeError(std::string reason, std::optional<Printing> canonical_printing = std::nullopt);

    // The printing the oracle would have accepted for this card, never applied automatically
    const std::optional<Printing>& GetCanonicalPrinting() const;

  private:
    std::optional<Printing> m_CanonicalPrinting;
};

class InvalidCollectorNumberError : public SanitizationError
{
  public:
    InvalidCollectorNumberError(std::string reason, std::optional<Printing> canonical_printing = std::nullopt);

    const std::optional<Printing>& GetCanonicalPrinting() const;

  private:
    std::optional<Printing> m_CanonicalPrinting;
};

class DuplicateCardError : public SanitizationError
{
  public:
    DuplicateCardError(std::string card_name, std::string_view section);

    const std::string& GetSection() const;

  private:
    std::string m_Section;
};

/*
        Raised by the export validator, deliberately not a SanitizationError:
        the deck was valid when it was sanitized, the world changed afterwards
*/
class ArenaImportabilityError : public std::runtime_error
{
  public:
    ArenaImportabilityError(std::string reason, std::optional<std::string> card_name = std::nullopt);

    ErrorKind GetKind() const;
    const std::optional<std::string>& GetCardName() const;

  private:
    std::optional<std::string> m_CardName;
};

/*
        Raised by a PrintingOracle that could not answer a query at all,
        must never be confused with a printing that does not exist
*/
class PrintingOracleError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;

    ErrorKind GetKind() const;
};

class CardDatabaseError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;

    ErrorKind GetKind() const;
};
