#pragma once

#include <optional>
#include <string_view>

#include <ads/deck/printing.hpp>

/*
        Read-only view on card printing data, injected into the sanitizer and the export validator
        Implementations that can fail to answer (I/O, timeouts) throw PrintingOracleError,
        they must never report such a failure as a missing printing
*/
class PrintingOracle
{
  public:
    virtual ~PrintingOracle() = default;

    // True if this exact printing exists and can be imported into Arena
    virtual bool IsArenaValidPrinting(std::string_view name,
                                      std::string_view set_code,
                                      std::string_view collector_number) const = 0;

    // The preferred importable printing of a card, std::nullopt if there is none
    virtual std::optional<Printing> GetCanonicalArenaPrinting(std::string_view name) const = 0;
};
