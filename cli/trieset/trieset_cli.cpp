#include <curl/curl.h>

#include <charconv>
#include <system_error>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common/utf8.hpp"
#include "trie_set/invalid_character_error.hpp"
#include "trie_set/trie_set.hpp"
#include "wordlist/word_list.hpp"

using namespace trieset;

static void usage(const char *argv0)
{
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " (--words <file> | --url <url>)... [--contains W] [--prefix P] [--longest Q] [--match PATTERN] [--keys] [--limit N]\n"
        << "  " << argv0 << " (--words <file> | --url <url>)... --stdin [--limit N]\n"
        << "\n"
        << "stdin commands (one per line):\n"
        << "  add <w> | remove <w> | contains <w> | prefix <p> | longest <q> | match <pattern> | keys | size\n"
        << "\n"
        << "'" << static_cast<char>(TrieSet::WILDCARD) << "' in a pattern matches any single letter.\n";
}

static bool parse_int(std::string_view s, int &out)
{
    int value = 0;
    const char *begin = s.data();
    const char *end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (s.empty() || ec != std::errc() || ptr != end)
        return false;
    out = value;
    return true;
}

struct Source
{
    bool isUrl;
    std::string location;
};

static void load_source(TrieSet &set, const Source &src)
{
    const WordList list = src.isUrl ? fetchWordList(src.location)
                                    : readWordListFile(src.location);

    for (size_t line : list.badUtf8Lines)
        std::cerr << "[BAD_UTF8] " << src.location << ":" << line << "\n";

    const AddReport report = addWords(set, list.words);
    for (const auto &r : report.rejected)
    {
        std::cerr << "[SKIP] " << u32ToUtf8(r.word)
                  << " invalid character " << codePointLabel(r.character)
                  << " at position " << r.position << "\n";
    }

    std::cerr << "Loaded " << src.location
              << " | words=" << list.words.size()
              << " | added=" << report.added
              << " | duplicates=" << report.duplicates
              << " | rejected=" << report.rejected.size() << "\n";
}

static bool decode_arg(const std::string &utf8, std::u32string &out)
{
    if (utf8ToU32(utf8, out))
        return true;
    std::cout << "[BAD_UTF8] " << utf8 << "\n";
    return false;
}

static void print_keys(const KeyRange &range, int limit)
{
    int printed = 0;
    size_t total = 0;
    for (const auto &k : range)
    {
        ++total;
        if (limit >= 0 && printed >= limit)
            continue;
        std::cout << "  " << u32ToUtf8(k) << "\n";
        ++printed;
    }
    if (limit >= 0 && total > static_cast<size_t>(printed))
        std::cout << "  ... (" << (total - static_cast<size_t>(printed)) << " more)\n";
}

static void run_command(TrieSet &set, std::string_view cmd, const std::string &arg, int limit)
{
    std::u32string key;
    if (cmd == "size")
    {
        std::cout << "size=" << set.size() << "\n";
        return;
    }
    if (cmd == "keys")
    {
        std::cout << "keys (" << set.size() << ")\n";
        print_keys(set.keys(), limit);
        return;
    }

    if (!decode_arg(arg, key))
        return;

    if (cmd == "add")
    {
        try
        {
            const bool added = set.add(key);
            std::cout << "add " << arg << " -> " << (added ? "added" : "present") << "\n";
        }
        catch (const InvalidCharacterError &e)
        {
            std::cout << "add " << arg << " -> rejected: " << e.what() << "\n";
        }
    }
    else if (cmd == "remove")
    {
        const bool removed = set.remove(key);
        std::cout << "remove " << arg << " -> " << (removed ? "removed" : "absent") << "\n";
    }
    else if (cmd == "contains")
    {
        std::cout << "contains " << arg << " -> " << (set.contains(key) ? "true" : "false") << "\n";
    }
    else if (cmd == "prefix")
    {
        std::cout << "prefix " << arg << "\n";
        print_keys(set.keysWithPrefix(key), limit);
    }
    else if (cmd == "longest")
    {
        const auto hit = set.longestPrefixOf(key);
        std::cout << "longest " << arg << " -> " << (hit ? u32ToUtf8(*hit) : std::string("(none)")) << "\n";
    }
    else if (cmd == "match")
    {
        try
        {
            const auto hits = set.keysThatMatch(key);
            std::cout << "match " << arg << " hits=" << hits.size() << "\n";
            int printed = 0;
            for (const auto &h : hits)
            {
                if (limit >= 0 && printed >= limit)
                    break;
                std::cout << "  " << u32ToUtf8(h) << "\n";
                ++printed;
            }
        }
        catch (const InvalidCharacterError &e)
        {
            std::cout << "match " << arg << " -> rejected: " << e.what() << "\n";
        }
    }
    else
    {
        std::cout << "[UNKNOWN] " << cmd << "\n";
    }
}

int main(int argc, char **argv)
{
    try
    {
        std::vector<Source> sources;
        std::vector<std::pair<std::string, std::string>> queries;
        bool stdin_mode = false;
        int limit = 50;

        for (int i = 1; i < argc; ++i)
        {
            const std::string a = argv[i];
            if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            if (a == "--words" && i + 1 < argc)
            {
                sources.push_back(Source{false, argv[++i]});
                continue;
            }
            if (a == "--url" && i + 1 < argc)
            {
                sources.push_back(Source{true, argv[++i]});
                continue;
            }
            if ((a == "--contains" || a == "--prefix" || a == "--longest" || a == "--match") && i + 1 < argc)
            {
                queries.emplace_back(a.substr(2), argv[++i]);
                continue;
            }
            if (a == "--keys")
            {
                queries.emplace_back("keys", std::string());
                continue;
            }
            if (a == "--stdin")
            {
                stdin_mode = true;
                continue;
            }
            if (a == "--limit" && i + 1 < argc)
            {
                const std::string v = argv[++i];
                if (!parse_int(v, limit))
                {
                    std::cerr << "Invalid --limit: " << v << "\n";
                    usage(argv[0]);
                    return 2;
                }
                continue;
            }
            std::cerr << "Unknown/incomplete arg: " << a << "\n";
            usage(argv[0]);
            return 2;
        }

        if (!stdin_mode && queries.empty())
        {
            usage(argv[0]);
            return 2;
        }

        TrieSet set;

        curl_global_init(CURL_GLOBAL_DEFAULT);
        try
        {
            for (const auto &src : sources)
                load_source(set, src);
        }
        catch (...)
        {
            curl_global_cleanup();
            throw;
        }
        curl_global_cleanup();

        std::cerr << "size=" << set.size() << " nodes=" << set.nodeCount() << "\n";

        if (!stdin_mode)
        {
            for (const auto &q : queries)
                run_command(set, q.first, q.second, limit);
            return 0;
        }

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.empty())
                continue;

            const size_t sp = line.find(' ');
            const std::string cmd = line.substr(0, sp);
            const std::string arg = (sp == std::string::npos) ? std::string() : line.substr(sp + 1);
            run_command(set, cmd, arg, limit);
        }

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
