/**
 * @file input_reader.h
 * @brief Line-oriented UVCI input with source line numbers
 */

#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace uvci {

/// @brief One candidate UVCI and where it came from
struct InputLine {
    size_t lineNumber = 0;  ///< 1-based line in the source
    std::string text;       ///< Trimmed, never empty
};

/**
 * @brief Read trimmed, non-empty lines
 *
 * Blank lines are skipped but still counted, so lineNumber always refers
 * to the line in the source.
 */
std::vector<InputLine> readInputLines(std::istream& in);

/**
 * @brief Read an input file with readInputLines()
 * @throws common::IoException if the file cannot be opened
 */
std::vector<InputLine> readInputFile(const std::string& path);

} // namespace uvci
