#pragma once

#include <string>

class SanitizedDeck;

// Arena import text, lines separated by '\n' without a trailing newline
std::string FormatDeckForArena(const SanitizedDeck& deck);
