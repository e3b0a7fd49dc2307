/**
 * @file input_reader.cpp
 * @brief Line-oriented UVCI input implementation
 */

#include "uvci/input_reader.h"
#include "uvci/common/exceptions.h"
#include "uvci/utils/string_utils.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace uvci {

std::vector<InputLine> readInputLines(std::istream& in) {
    std::vector<InputLine> lines;
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        std::string text = utils::trim(line);
        if (text.empty()) {
            continue;
        }
        InputLine input;
        input.lineNumber = lineNumber;
        input.text = std::move(text);
        lines.push_back(std::move(input));
    }
    return lines;
}

std::vector<InputLine> readInputFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw common::IoException("cannot open input file " + path);
    }
    auto lines = readInputLines(file);
    spdlog::debug("Read {} UVCIs from {}", lines.size(), path);
    return lines;
}

} // namespace uvci
