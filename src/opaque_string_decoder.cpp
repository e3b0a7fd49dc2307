/**
 * @file opaque_string_decoder.cpp
 * @brief Opaque unique string decoder implementation
 */

#include "uvci/opaque_string_decoder.h"
#include <cctype>

namespace uvci {

OpaqueSegments decodeOpaqueString(const std::string& opaque) {
    OpaqueSegments segments;

    size_t pos = 0;
    if (pos < opaque.size() && std::isalpha(static_cast<unsigned char>(opaque[pos]))) {
        ++pos;
    }

    size_t digitsStart = pos;
    while (pos < opaque.size() && std::isdigit(static_cast<unsigned char>(opaque[pos]))) {
        ++pos;
    }

    if (pos == digitsStart) {
        return segments;
    }

    segments.id = opaque.substr(0, pos);
    segments.issuance = opaque.substr(pos);
    return segments;
}

} // namespace uvci
