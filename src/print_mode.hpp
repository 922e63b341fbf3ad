#pragma once
/*
 * Print mode
 *
 * Purpose: non-interactive output for `uketui C,Am` and `uketui --list`.
 * Exit codes: 0 when at least one chord resolved, 2 when none did.
 */
#include <ostream>
#include <string>
#include "chord_table.hpp"

// $COLUMNS value to print width; unset or invalid falls back to UKE_PRINT_WIDTH.
int print_width(const char* columns);

int print_chords(const ChordTable& table, const std::string& query, int width, std::ostream& out);

// One line per name: the name followed by every voicing, comma separated.
void list_chords(const ChordTable& table, std::ostream& out);
