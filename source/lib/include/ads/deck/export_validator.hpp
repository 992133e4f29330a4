#pragma once

class PrintingOracle;
class SanitizedDeck;

/*
        Re-checks a sanitized deck right before it is exported, the oracle might have
        changed since the deck was sanitized. Throws ArenaImportabilityError.
*/
void ValidateArenaExport(const SanitizedDeck& deck, const PrintingOracle& oracle);
