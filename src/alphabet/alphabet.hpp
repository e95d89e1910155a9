// src/alphabet/alphabet.hpp
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trieset
{

    // Immutable set of code points legal as trie edge labels.
    // Code points are kept sorted ascending; rank() is the index in that order.
    class Alphabet
    {
    public:
        explicit Alphabet(std::vector<char32_t> codePoints);

        bool isSupported(char32_t c) const;

        // Dense 0-based index, or -1 if c is not in the alphabet.
        int rank(char32_t c) const;
        char32_t at(size_t rank) const;

        size_t size() const { return codePoints_.size(); }
        const std::vector<char32_t> &codePoints() const { return codePoints_; }

        // Position of the first unsupported code point in key, if any.
        std::optional<size_t> findInvalid(const std::u32string &key) const;

    private:
        std::vector<char32_t> codePoints_;
    };

} // namespace trieset
