#pragma once

#include <cstdint>
#include <string>

class QString;

// Each validator checks exactly one raw token and throws its dedicated error,
// a returned value satisfies all invariants of the corresponding SanitizedCard field.

// Throws InvalidQuantityError
uint32_t ValidateQuantity(const QString& raw_quantity);

// Throws InvalidCardNameError
std::string ValidateCardName(const QString& raw_name);

// Throws InvalidSetCodeError, also for set codes Arena can not import
std::string ValidateSetCode(const QString& raw_set_code);

// Throws InvalidCollectorNumberError
std::string ValidateCollectorNumber(const QString& raw_collector_number);
