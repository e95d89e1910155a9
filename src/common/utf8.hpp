// src/common/utf8.hpp
#pragma once
#include <string>
#include <string_view>

namespace trieset
{

    // Strict decoding: rejects overlong forms, surrogates and truncated
    // sequences. out is cleared first.
    bool utf8ToU32(std::string_view s, std::u32string &out);

    // Returns false and appends nothing for surrogates and values above
    // U+10FFFF.
    bool appendUtf8(std::string &out, char32_t cp);

    // Throws std::invalid_argument on a code point appendUtf8 rejects.
    std::string u32ToUtf8(const std::u32string &s);

    // "U+00F7"
    std::string codePointLabel(char32_t c);

} // namespace trieset
