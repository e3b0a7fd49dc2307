/**
 * @file opaque_string_decoder.h
 * @brief Identifier/issuance split of opaque unique strings
 *
 * Swedish E-Hälsomyndigheten payloads such as "V12916227TFJJ" carry a
 * sequential identifier ("V12916227") followed by an issuance code ("TFJJ")
 * that changes when the certificate is reissued. The split is advisory:
 * a payload without that shape simply yields empty segments.
 */

#pragma once

#include <string>

namespace uvci {

/// @brief Segments of an opaque unique string
struct OpaqueSegments {
    std::string id;        ///< Optional single letter + maximal digit run
    std::string issuance;  ///< Remainder after the identifier

    bool empty() const { return id.empty() && issuance.empty(); }
};

/**
 * @brief Split an opaque unique string into identifier and issuance segments
 *
 * @param opaque Option 3 payload
 * @return Both segments empty if the string has no leading digit run
 *         (optionally after one letter)
 *
 * @example
 * decodeOpaqueString("V12916227TFJJ");  // {"V12916227", "TFJJ"}
 * decodeOpaqueString("37512422923");    // {"37512422923", ""}
 * decodeOpaqueString("ABCDEF");         // {"", ""}
 */
OpaqueSegments decodeOpaqueString(const std::string& opaque);

} // namespace uvci
