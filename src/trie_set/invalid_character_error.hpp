// src/trie_set/invalid_character_error.hpp
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace trieset
{

    // Thrown when a key to be stored holds a code point outside the alphabet.
    class InvalidCharacterError : public std::invalid_argument
    {
    public:
        InvalidCharacterError(char32_t character, size_t position);

        char32_t character() const noexcept { return character_; }
        size_t position() const noexcept { return position_; }

    private:
        char32_t character_;
        size_t position_;
    };

} // namespace trieset
