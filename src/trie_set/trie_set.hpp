// src/trie_set/trie_set.hpp
#pragma once
#include <cstddef>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "alphabet/alphabet.hpp"

namespace trieset
{

    struct TrieNode
    {
        bool isKey{false};

        // Ordered by code point, which is the alphabet order.
        std::map<char32_t, std::unique_ptr<TrieNode>> children;

        bool hasChild() const { return !children.empty(); }

        TrieNode *getChild(char32_t ch)
        {
            auto it = children.find(ch);
            return (it == children.end()) ? nullptr : it->second.get();
        }
        const TrieNode *getChild(char32_t ch) const
        {
            auto it = children.find(ch);
            return (it == children.end()) ? nullptr : it->second.get();
        }

        // Returns the child for ch, creating it if absent.
        TrieNode *addChild(char32_t ch)
        {
            auto &slot = children[ch];
            if (!slot)
                slot = std::make_unique<TrieNode>();
            return slot.get();
        }

        void removeChild(char32_t ch) { children.erase(ch); }
    };

    // Depth-first walk over the keys below a node, in ascending order.
    // Invalidated by any mutation of the owning TrieSet.
    class KeyIterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::u32string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::u32string *;
        using reference = const std::u32string &;

        KeyIterator() = default;
        KeyIterator(const TrieNode *start, std::u32string prefix);

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        KeyIterator &operator++();
        KeyIterator operator++(int);

        bool operator==(const KeyIterator &other) const;
        bool operator!=(const KeyIterator &other) const { return !(*this == other); }

    private:
        struct Frame
        {
            const TrieNode *node;
            std::map<char32_t, std::unique_ptr<TrieNode>>::const_iterator next;
        };

        void advance();

        std::vector<Frame> stack_;
        std::u32string current_;
    };

    // Lazy, restartable sequence of keys: every begin() starts a new walk.
    class KeyRange
    {
    public:
        KeyRange() = default;
        KeyRange(const TrieNode *start, std::u32string prefix);

        KeyIterator begin() const { return KeyIterator(start_, prefix_); }
        KeyIterator end() const { return KeyIterator(); }

        bool empty() const { return begin() == end(); }
        std::vector<std::u32string> toVector() const;

    private:
        const TrieNode *start_{nullptr};
        std::u32string prefix_;
    };

    // Set of strings over a restricted alphabet (Latin letters by default).
    //
    // Not thread-safe: concurrent add()/remove() without external
    // synchronization leaves the structure undefined.
    class TrieSet
    {
    public:
        static constexpr char32_t WILDCARD = U'.';

        TrieSet();
        explicit TrieSet(const Alphabet &alphabet);

        ~TrieSet();

        TrieSet(const TrieSet &) = delete;
        TrieSet &operator=(const TrieSet &) = delete;

        // The source is left empty, with a fresh root.
        TrieSet(TrieSet &&other);
        TrieSet &operator=(TrieSet &&other);

        // Returns true if key was not present before.
        // Throws InvalidCharacterError before touching the tree.
        bool add(const std::u32string &key);
        bool add(const char32_t *key);

        bool contains(const std::u32string &key) const;

        // Returns true if key was present. Prunes nodes left without purpose.
        bool remove(const std::u32string &key);
        bool remove(const char32_t *key);

        size_t size() const { return count; }
        bool isEmpty() const { return count == 0; }

        KeyRange keys() const;
        KeyRange keysWithPrefix(const std::u32string &prefix) const;

        std::optional<std::u32string> longestPrefixOf(const std::u32string &query) const;

        // WILDCARD matches any single character. Literal positions must be
        // in the alphabet, otherwise InvalidCharacterError is thrown.
        std::vector<std::u32string> keysThatMatch(const std::u32string &pattern) const;

        // Number of nodes including the root.
        size_t nodeCount() const;

        void clear();

        const Alphabet &alphabet() const { return *alphabet_; }
        const TrieNode *getRoot() const { return root.get(); }

    private:
        // Releases a subtree without recursing once per level.
        static void destroy(std::unique_ptr<TrieNode> node);

        const TrieNode *findNode(const std::u32string &key) const;
        void collectMatches(const TrieNode *node,
                            const std::u32string &pattern,
                            std::u32string &path,
                            std::vector<std::u32string> &out) const;

        std::unique_ptr<TrieNode> root;
        const Alphabet *alphabet_;
        size_t count;
    };

} // namespace trieset
