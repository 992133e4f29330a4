#include <ads/deck/errors.hpp>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

std::string_view ErrorKindName(ErrorKind kind)
{
    return magic_enum::enum_name(kind);
}

SanitizationError::SanitizationError(ErrorKind kind, std::string reason)
    : std::runtime_error{ reason }
    , m_Kind{ kind }
    , m_Reason{ std::move(reason) }
{
}

ErrorKind SanitizationError::GetKind() const
{
    return m_Kind;
}
const std::string& SanitizationError::GetReason() const
{
    return m_Reason;
}

std::optional<uint32_t> SanitizationError::GetLineNumber() const
{
    return m_LineNumber;
}
void SanitizationError::SetLineNumber(uint32_t line_number)
{
    m_LineNumber = line_number;
}

const std::optional<std::string>& SanitizationError::GetCardName() const
{
    return m_CardName;
}
void SanitizationError::SetCardName(std::string card_name)
{
    m_CardName = std::move(card_name);
}

InvalidDeckStructureError::InvalidDeckStructureError(std::string reason, std::optional<uint32_t> line_number)
    : SanitizationError{ ErrorKind::InvalidDeckStructure, std::move(reason) }
{
    if (line_number.has_value())
    {
        SetLineNumber(line_number.value());
    }
}

InvalidQuantityError::InvalidQuantityError(std::string reason)
    : SanitizationError{ ErrorKind::InvalidQuantity, std::move(reason) }
{
}

InvalidCardNameError::InvalidCardNameError(std::string reason)
    : SanitizationError{ ErrorKind::InvalidCardName, std::move(reason) }
{
}

InvalidSetCodeError::InvalidSetCodeError(std::string reason, std::optional<Printing> canonical_printing)
    : SanitizationError{ ErrorKind::InvalidSetCode, std::move(reason) }
    , m_CanonicalPrinting{ std::move(canonical_printing) }
{
}
const std::optional<Printing>& InvalidSetCodeError::GetCanonicalPrinting() const
{
    return m_CanonicalPrinting;
}

InvalidCollectorNumberError::InvalidCollectorNumberError(std::string reason, std::optional<Printing> canonical_printing)
    : SanitizationError{ ErrorKind::InvalidCollectorNumber, std::move(reason) }
    , m_CanonicalPrinting{ std::move(canonical_printing) }
{
}
const std::optional<Printing>& InvalidCollectorNumberError::GetCanonicalPrinting() const
{
    return m_CanonicalPrinting;
}

DuplicateCardError::DuplicateCardError(std::string card_name, std::string_view section)
    : SanitizationError{
        ErrorKind::DuplicateCard,
        fmt::format("Duplicate entry for '{}' in section {}", card_name, section),
    }
    , m_Section{ section }
{
    SetCardName(std::move(card_name));
}
const std::string& DuplicateCardError::GetSection() const
{
    return m_Section;
}

ArenaImportabilityError::ArenaImportabilityError(std::string reason, std::optional<std::string> card_name)
    : std::runtime_error{ std::move(reason) }
    , m_CardName{ std::move(card_name) }
{
}
ErrorKind ArenaImportabilityError::GetKind() const
{
    return ErrorKind::ArenaImportability;
}
const std::optional<std::string>& ArenaImportabilityError::GetCardName() const
{
    return m_CardName;
}

ErrorKind PrintingOracleError::GetKind() const
{
    return ErrorKind::PrintingOracle;
}

ErrorKind CardDatabaseError::GetKind() const
{
    return ErrorKind::CardDatabase;
}
