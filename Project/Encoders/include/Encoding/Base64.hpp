#pragma once
/*********************************************************************************
* @File         Base64.hpp
* @Brief        Portable Base64 encoding and decoding used for byte sequences:
*                  - Base64_Encode: encodes bytes to a single-line Base64 string
*                    (standard alphabet, '=' padding, never wrapped).
*                  - Base64_Decode: decodes a Base64 string into bytes with
*                    whitespace-tolerant parsing, validation and padding support.
*
* Usage notes:
*    - Decoding ignores CR/LF/space/tab; however it enforces that the sanitized input
*      length is a multiple of 4 and that only valid Base64 characters (A-Z,a-z,0-9,+,/)
*      and '=' padding are used. Malformed input is logged and yields an empty vector.
*********************************************************************************/
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Logging.hpp"

namespace Encoders {

// Encodes a range of bytes to a base64 string.
ENCODERS_API std::string Base64_Encode(const std::uint8_t* data, std::size_t size);

// Encodes a vector of bytes to a base64 string.
ENCODERS_API std::string Base64_Encode(const std::vector<std::uint8_t>& data);

// Decodes a base64 string to a vector of bytes.
ENCODERS_API std::vector<std::uint8_t> Base64_Decode(const std::string& data);

}
