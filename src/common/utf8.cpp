// src/common/utf8.cpp
#include "common/utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <stdexcept>

namespace trieset
{

    static bool utf8NextCodepoint(std::string_view s, size_t &i, char32_t &outCp)
    {
        if (i >= s.size())
            return false;
        const unsigned char c0 = static_cast<unsigned char>(s[i]);

        if (c0 < 0x80)
        {
            outCp = c0;
            ++i;
            return true;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t minCp = 0;
        if ((c0 & 0xE0) == 0xC0)
        {
            len = 2;
            cp = c0 & 0x1F;
            minCp = 0x80;
        }
        else if ((c0 & 0xF0) == 0xE0)
        {
            len = 3;
            cp = c0 & 0x0F;
            minCp = 0x800;
        }
        else if ((c0 & 0xF8) == 0xF0)
        {
            len = 4;
            cp = c0 & 0x07;
            minCp = 0x10000;
        }
        else
        {
            return false;
        }

        if (i + len > s.size())
            return false;
        for (size_t k = 1; k < len; ++k)
        {
            const unsigned char ck = static_cast<unsigned char>(s[i + k]);
            if ((ck & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (ck & 0x3F);
        }

        if (cp < minCp)
            return false; // overlong
        if (cp >= 0xD800 && cp <= 0xDFFF)
            return false; // surrogate
        if (cp > 0x10FFFF)
            return false;

        outCp = cp;
        i += len;
        return true;
    }

    bool utf8ToU32(std::string_view s, std::u32string &out)
    {
        out.clear();
        out.reserve(s.size());

        size_t i = 0;
        while (i < s.size())
        {
            char32_t cp = 0;
            if (!utf8NextCodepoint(s, i, cp))
                return false;
            out.push_back(cp);
        }
        return true;
    }

    static bool isScalarValue(char32_t cp)
    {
        return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
    }

    bool appendUtf8(std::string &out, char32_t cp)
    {
        if (!isScalarValue(cp))
            return false;

        if (cp <= 0x7F)
            out.push_back(static_cast<char>(cp));
        else if (cp <= 0x7FF)
        {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else if (cp <= 0xFFFF)
        {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        return true;
    }

    std::string u32ToUtf8(const std::u32string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (!appendUtf8(out, s[i]))
                throw std::invalid_argument("u32ToUtf8: invalid code point " + codePointLabel(s[i]) +
                                            " at position " + std::to_string(i));
        }
        return out;
    }

    std::string codePointLabel(char32_t c)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(static_cast<uint32_t>(c)));
        return buf;
    }

} // namespace trieset
