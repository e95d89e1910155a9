// src/alphabet/latin_alphabet.hpp
#pragma once
#include <vector>

#include "alphabet/alphabet.hpp"

namespace trieset
{

    // Upper- and lowercase letters of Basic Latin, Latin-1 Supplement and
    // Latin Extended-A.
    //
    // Excluded code points:
    //   U+00D7, U+00F7  multiplication / division sign (Latin-1)
    //   U+0138          kra
    //   U+0149          n preceded by apostrophe (deprecated)
    //   U+017F          long s
    //
    // All tables are built once on first use and never change afterwards.
    namespace latin
    {
        const std::vector<char32_t> &basicUpper();
        const std::vector<char32_t> &basicLower();
        const std::vector<char32_t> &latin1Upper();
        const std::vector<char32_t> &latin1Lower();
        const std::vector<char32_t> &latinAUpper();
        const std::vector<char32_t> &latinALower();

        // Basic, then Latin-1, then Latin-A. Ascending, since the blocks are.
        const std::vector<char32_t> &allUpper();
        const std::vector<char32_t> &allLower();

        bool isExcluded(char32_t c);
    } // namespace latin

    // Union of allUpper() and allLower().
    const Alphabet &latinAlphabet();

} // namespace trieset
