#pragma once
/*
 * ChordParser
 *
 * Purpose: split prompt text into chord name tokens on ','.
 * Note: tokens are trimmed, empty ones dropped; names are not validated here.
 */
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::vector<std::string> parse_chord_list(const std::string& input);
