// src/trie_set/invalid_character_error.cpp
#include "trie_set/invalid_character_error.hpp"

#include "common/utf8.hpp"

namespace trieset
{

    InvalidCharacterError::InvalidCharacterError(char32_t character, size_t position)
        : std::invalid_argument("invalid character " + codePointLabel(character) +
                                " at position " + std::to_string(position)),
          character_(character),
          position_(position)
    {
    }

} // namespace trieset
