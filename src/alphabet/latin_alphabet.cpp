// src/alphabet/latin_alphabet.cpp
#include "alphabet/latin_alphabet.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace trieset
{

    namespace
    {
        constexpr char32_t BASIC_UPPER_BEGIN = 0x0041;
        constexpr char32_t BASIC_UPPER_END = 0x005A;
        constexpr char32_t BASIC_LOWER_BEGIN = BASIC_UPPER_BEGIN + 0x0020;
        constexpr char32_t BASIC_LOWER_END = BASIC_UPPER_END + 0x0020;

        constexpr char32_t LATIN1_UPPER_BEGIN = 0x00C0;
        constexpr char32_t LATIN1_UPPER_END = 0x00DE;
        constexpr char32_t LATIN1_LOWER_BEGIN = 0x00DF;
        constexpr char32_t LATIN1_LOWER_END = LATIN1_LOWER_BEGIN + 0x0020;

        constexpr char32_t LATIN_A_BEGIN = 0x0100;
        constexpr char32_t LATIN_A_END = 0x017F;

        constexpr std::array<char32_t, 2> EXCLUDES_LATIN1 = {0x00D7, 0x00F7};
        constexpr std::array<char32_t, 3> EXCLUDES_LATIN_A = {0x0138, 0x0149, 0x017F};

        // Latin Extended-A pairs an uppercase letter with the following
        // lowercase one. The pairing starts on even code points, shifts to odd
        // after U+0138 and back to even after U+0149. U+0178 has no lowercase
        // partner in the block, so U+0179..U+017E pair on odd code points.
        bool isLatinAUpper(char32_t c)
        {
            if (c <= 0x0137)
                return (c & 1) == 0;
            if (c >= 0x0139 && c <= 0x0148)
                return (c & 1) == 1;
            if (c >= 0x014A && c <= 0x0177)
                return (c & 1) == 0;
            if (c == 0x0178)
                return true;
            return (c & 1) == 1;
        }

        std::vector<char32_t> range(char32_t first, char32_t last)
        {
            std::vector<char32_t> out;
            out.reserve(static_cast<size_t>(last - first + 1));
            for (char32_t c = first; c <= last; ++c)
            {
                if (!latin::isExcluded(c))
                    out.push_back(c);
            }
            return out;
        }

        std::vector<char32_t> latinA(bool upper)
        {
            std::vector<char32_t> out;
            for (char32_t c : range(LATIN_A_BEGIN, LATIN_A_END))
            {
                if (isLatinAUpper(c) == upper)
                    out.push_back(c);
            }
            return out;
        }

        std::vector<char32_t> concat(const std::vector<char32_t> &a,
                                     const std::vector<char32_t> &b,
                                     const std::vector<char32_t> &c)
        {
            std::vector<char32_t> out;
            out.reserve(a.size() + b.size() + c.size());
            out.insert(out.end(), a.begin(), a.end());
            out.insert(out.end(), b.begin(), b.end());
            out.insert(out.end(), c.begin(), c.end());
            return out;
        }

        struct Tables
        {
            std::vector<char32_t> basicUpper = range(BASIC_UPPER_BEGIN, BASIC_UPPER_END);
            std::vector<char32_t> basicLower = range(BASIC_LOWER_BEGIN, BASIC_LOWER_END);
            std::vector<char32_t> latin1Upper = range(LATIN1_UPPER_BEGIN, LATIN1_UPPER_END);
            std::vector<char32_t> latin1Lower = range(LATIN1_LOWER_BEGIN, LATIN1_LOWER_END);
            std::vector<char32_t> latinAUpper = latinA(true);
            std::vector<char32_t> latinALower = latinA(false);
            std::vector<char32_t> allUpper = concat(basicUpper, latin1Upper, latinAUpper);
            std::vector<char32_t> allLower = concat(basicLower, latin1Lower, latinALower);
        };

        const Tables &tables()
        {
            static const Tables t;
            return t;
        }
    } // namespace

    namespace latin
    {
        const std::vector<char32_t> &basicUpper() { return tables().basicUpper; }
        const std::vector<char32_t> &basicLower() { return tables().basicLower; }
        const std::vector<char32_t> &latin1Upper() { return tables().latin1Upper; }
        const std::vector<char32_t> &latin1Lower() { return tables().latin1Lower; }
        const std::vector<char32_t> &latinAUpper() { return tables().latinAUpper; }
        const std::vector<char32_t> &latinALower() { return tables().latinALower; }
        const std::vector<char32_t> &allUpper() { return tables().allUpper; }
        const std::vector<char32_t> &allLower() { return tables().allLower; }

        bool isExcluded(char32_t c)
        {
            return std::find(EXCLUDES_LATIN1.begin(), EXCLUDES_LATIN1.end(), c) != EXCLUDES_LATIN1.end()
                || std::find(EXCLUDES_LATIN_A.begin(), EXCLUDES_LATIN_A.end(), c) != EXCLUDES_LATIN_A.end();
        }
    } // namespace latin

    const Alphabet &latinAlphabet()
    {
        static const Alphabet alphabet = [] {
            std::vector<char32_t> all = latin::allUpper();
            const auto &lower = latin::allLower();
            all.insert(all.end(), lower.begin(), lower.end());
            return Alphabet(std::move(all));
        }();
        return alphabet;
    }

} // namespace trieset
