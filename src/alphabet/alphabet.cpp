// src/alphabet/alphabet.cpp
#include "alphabet/alphabet.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace trieset
{

    Alphabet::Alphabet(std::vector<char32_t> codePoints)
        : codePoints_(std::move(codePoints))
    {
        std::sort(codePoints_.begin(), codePoints_.end());
        codePoints_.erase(std::unique(codePoints_.begin(), codePoints_.end()),
                          codePoints_.end());
    }

    bool Alphabet::isSupported(char32_t c) const
    {
        return std::binary_search(codePoints_.begin(), codePoints_.end(), c);
    }

    int Alphabet::rank(char32_t c) const
    {
        auto it = std::lower_bound(codePoints_.begin(), codePoints_.end(), c);
        if (it == codePoints_.end() || *it != c)
            return -1;
        return static_cast<int>(it - codePoints_.begin());
    }

    char32_t Alphabet::at(size_t rank) const
    {
        if (rank >= codePoints_.size())
            throw std::out_of_range("Alphabet: rank out of range: " + std::to_string(rank));
        return codePoints_[rank];
    }

    std::optional<size_t> Alphabet::findInvalid(const std::u32string &key) const
    {
        for (size_t i = 0; i < key.size(); ++i)
        {
            if (!isSupported(key[i]))
                return i;
        }
        return std::nullopt;
    }

} // namespace trieset
