// src/trie_set/trie_set.cpp
#include "trie_set/trie_set.hpp"

#include <stdexcept>
#include <utility>

#include "alphabet/latin_alphabet.hpp"
#include "trie_set/invalid_character_error.hpp"

namespace trieset
{

    // -----------------------------
    // KeyIterator
    // -----------------------------
    KeyIterator::KeyIterator(const TrieNode *start, std::u32string prefix)
        : current_(std::move(prefix))
    {
        if (!start)
            return;
        stack_.push_back(Frame{start, start->children.begin()});
        if (!start->isKey)
            advance();
    }

    KeyIterator &KeyIterator::operator++()
    {
        advance();
        return *this;
    }

    KeyIterator KeyIterator::operator++(int)
    {
        KeyIterator prev = *this;
        advance();
        return prev;
    }

    bool KeyIterator::operator==(const KeyIterator &other) const
    {
        if (stack_.empty() || other.stack_.empty())
            return stack_.empty() == other.stack_.empty();
        return stack_.size() == other.stack_.size()
            && stack_.back().node == other.stack_.back().node;
    }

    // Pre-order: a key is emitted when its node is entered, before its
    // children, so shorter keys precede their extensions.
    void KeyIterator::advance()
    {
        while (!stack_.empty())
        {
            Frame &top = stack_.back();
            if (top.next != top.node->children.end())
            {
                const char32_t ch = top.next->first;
                const TrieNode *child = top.next->second.get();
                ++top.next;

                stack_.push_back(Frame{child, child->children.begin()});
                current_.push_back(ch);
                if (child->isKey)
                    return;
                continue;
            }

            stack_.pop_back();
            if (!stack_.empty())
                current_.pop_back();
        }
    }

    // -----------------------------
    // KeyRange
    // -----------------------------
    KeyRange::KeyRange(const TrieNode *start, std::u32string prefix)
        : start_(start), prefix_(std::move(prefix))
    {
    }

    std::vector<std::u32string> KeyRange::toVector() const
    {
        return std::vector<std::u32string>(begin(), end());
    }

    // -----------------------------
    // TrieSet
    // -----------------------------
    TrieSet::TrieSet() : TrieSet(latinAlphabet()) {}

    TrieSet::TrieSet(const Alphabet &alphabet)
        : root(std::make_unique<TrieNode>()), alphabet_(&alphabet), count(0)
    {
    }

    TrieSet::~TrieSet()
    {
        destroy(std::move(root));
    }

    TrieSet::TrieSet(TrieSet &&other)
        : root(std::make_unique<TrieNode>()), alphabet_(other.alphabet_), count(other.count)
    {
        root.swap(other.root);
        other.count = 0;
    }

    TrieSet &TrieSet::operator=(TrieSet &&other)
    {
        if (this == &other)
            return *this;

        auto fresh = std::make_unique<TrieNode>();
        destroy(std::move(root));
        root = std::move(other.root);
        alphabet_ = other.alphabet_;
        count = other.count;

        other.root = std::move(fresh);
        other.count = 0;
        return *this;
    }

    void TrieSet::destroy(std::unique_ptr<TrieNode> node)
    {
        std::vector<std::unique_ptr<TrieNode>> pending;
        pending.push_back(std::move(node));
        while (!pending.empty())
        {
            std::unique_ptr<TrieNode> cur = std::move(pending.back());
            pending.pop_back();
            if (!cur)
                continue;
            // Detach children first so cur's map holds only empty pointers
            // when it is released at the end of this iteration.
            for (auto &kv : cur->children)
                pending.push_back(std::move(kv.second));
        }
    }

    bool TrieSet::add(const std::u32string &key)
    {
        if (auto pos = alphabet_->findInvalid(key))
            throw InvalidCharacterError(key[*pos], *pos);

        TrieNode *cur = root.get();
        for (char32_t ch : key)
            cur = cur->addChild(ch);

        if (cur->isKey)
            return false;
        cur->isKey = true;
        ++count;
        return true;
    }

    bool TrieSet::add(const char32_t *key)
    {
        if (!key)
            throw std::invalid_argument("TrieSet::add: key must not be null");
        return add(std::u32string(key));
    }

    const TrieNode *TrieSet::findNode(const std::u32string &key) const
    {
        const TrieNode *cur = root.get();
        for (char32_t ch : key)
        {
            cur = cur->getChild(ch);
            if (!cur)
                return nullptr;
        }
        return cur;
    }

    bool TrieSet::contains(const std::u32string &key) const
    {
        // Unsupported characters never label an edge.
        const TrieNode *node = findNode(key);
        return node && node->isKey;
    }

    bool TrieSet::remove(const std::u32string &key)
    {
        std::vector<TrieNode *> path;
        path.reserve(key.size() + 1);
        path.push_back(root.get());

        for (char32_t ch : key)
        {
            TrieNode *next = path.back()->getChild(ch);
            if (!next)
                return false;
            path.push_back(next);
        }

        TrieNode *last = path.back();
        if (!last->isKey)
            return false;
        last->isKey = false;
        --count;

        // path[i] is reached from path[i - 1] through key[i - 1].
        for (size_t i = key.size(); i > 0; --i)
        {
            const TrieNode *node = path[i];
            if (node->isKey || node->hasChild())
                break;
            path[i - 1]->removeChild(key[i - 1]);
        }
        return true;
    }

    bool TrieSet::remove(const char32_t *key)
    {
        if (!key)
            throw std::invalid_argument("TrieSet::remove: key must not be null");
        return remove(std::u32string(key));
    }

    KeyRange TrieSet::keys() const
    {
        return KeyRange(root.get(), std::u32string());
    }

    KeyRange TrieSet::keysWithPrefix(const std::u32string &prefix) const
    {
        if (alphabet_->findInvalid(prefix))
            return KeyRange();
        const TrieNode *node = findNode(prefix);
        if (!node)
            return KeyRange();
        return KeyRange(node, prefix);
    }

    std::optional<std::u32string> TrieSet::longestPrefixOf(const std::u32string &query) const
    {
        const TrieNode *cur = root.get();
        std::optional<size_t> best;
        if (cur->isKey)
            best = 0;

        for (size_t i = 0; i < query.size(); ++i)
        {
            cur = cur->getChild(query[i]);
            if (!cur)
                break;
            if (cur->isKey)
                best = i + 1;
        }

        if (!best)
            return std::nullopt;
        return query.substr(0, *best);
    }

    std::vector<std::u32string> TrieSet::keysThatMatch(const std::u32string &pattern) const
    {
        for (size_t i = 0; i < pattern.size(); ++i)
        {
            const char32_t ch = pattern[i];
            if (ch != WILDCARD && !alphabet_->isSupported(ch))
                throw InvalidCharacterError(ch, i);
        }

        std::vector<std::u32string> out;
        std::u32string path;
        path.reserve(pattern.size());
        collectMatches(root.get(), pattern, path, out);
        return out;
    }

    void TrieSet::collectMatches(const TrieNode *node,
                                 const std::u32string &pattern,
                                 std::u32string &path,
                                 std::vector<std::u32string> &out) const
    {
        const size_t depth = path.size();
        if (depth == pattern.size())
        {
            if (node->isKey)
                out.push_back(path);
            return;
        }

        const char32_t ch = pattern[depth];
        if (ch == WILDCARD)
        {
            for (const auto &kv : node->children)
            {
                path.push_back(kv.first);
                collectMatches(kv.second.get(), pattern, path, out);
                path.pop_back();
            }
            return;
        }

        if (const TrieNode *child = node->getChild(ch))
        {
            path.push_back(ch);
            collectMatches(child, pattern, path, out);
            path.pop_back();
        }
    }

    size_t TrieSet::nodeCount() const
    {
        size_t n = 0;
        std::vector<const TrieNode *> pending{root.get()};
        while (!pending.empty())
        {
            const TrieNode *node = pending.back();
            pending.pop_back();
            ++n;
            for (const auto &kv : node->children)
                pending.push_back(kv.second.get());
        }
        return n;
    }

    void TrieSet::clear()
    {
        auto fresh = std::make_unique<TrieNode>();
        destroy(std::move(root));
        root = std::move(fresh);
        count = 0;
    }

} // namespace trieset
