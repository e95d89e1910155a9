// src/wordlist/word_list.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "trie_set/trie_set.hpp"

namespace trieset
{

    // Word list format: UTF-8 text, one word per line.
    // - surrounding spaces/tabs and a trailing '\r' are trimmed
    // - empty lines and lines starting with '#' are ignored
    struct WordList
    {
        std::vector<std::u32string> words;
        std::vector<size_t> badUtf8Lines; // 1-based
    };

    WordList parseWordList(std::istream &in);
    WordList readWordListFile(const std::filesystem::path &path);

    // Downloads url with libcurl. curl_global_init() must have been called.
    // Throws std::runtime_error on transport failure or a non-2xx status.
    std::string downloadText(const std::string &url);
    WordList fetchWordList(const std::string &url);

    struct RejectedWord
    {
        std::u32string word;
        char32_t character;
        size_t position;
    };

    struct AddReport
    {
        size_t added{0};
        size_t duplicates{0};
        std::vector<RejectedWord> rejected;
    };

    // Adds every word; words with characters outside the set's alphabet are
    // reported instead of aborting the whole load.
    AddReport addWords(TrieSet &set, const std::vector<std::u32string> &words);

} // namespace trieset
