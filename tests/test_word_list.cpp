#include <curl/curl.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "trie_set/trie_set.hpp"
#include "wordlist/word_list.hpp"

using namespace trieset;

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

static const char *SAMPLE =
    "# sample word list\n"
    "Latin\r\n"
    "  Latex\t\n"
    "\n"
    "Later\n"
    "Latin\n"
    "Straße\n"
    "a÷b\n"
    "bad\xC3\n"
    "Greek\n";

int main()
{
    // =========================================================
    // 1) parse from a stream
    // =========================================================
    {
        std::istringstream in(SAMPLE);
        WordList list = parseWordList(in);

        std::vector<std::u32string> expected = {U"Latin", U"Latex", U"Later", U"Latin", U"Straße", U"a÷b", U"Greek"};
        assert_true(list.words == expected, "words should be trimmed, comments and blanks skipped");
        assert_true(list.badUtf8Lines.size() == 1 && list.badUtf8Lines[0] == 9,
                    "line 9 should be reported as bad UTF-8");
    }

    // =========================================================
    // 2) addWords report
    // =========================================================
    {
        std::istringstream in(SAMPLE);
        WordList list = parseWordList(in);

        TrieSet t;
        AddReport report = addWords(t, list.words);
        assert_true(report.added == 5, "five distinct valid words");
        assert_true(report.duplicates == 1, "Latin appears twice");
        assert_true(report.rejected.size() == 1, "a÷b is rejected");
        assert_true(report.rejected[0].word == U"a÷b", "rejected word is kept");
        assert_true(report.rejected[0].character == 0x00F7, "rejected character is the division sign");
        assert_true(report.rejected[0].position == 1, "rejected position is 1");
        assert_true(t.size() == 5, "set holds the five valid words");
        assert_true(t.contains(U"Straße"), "sharp s word is present");
    }

    // =========================================================
    // 3) file and file:// URL
    // =========================================================
    {
        const std::filesystem::path path = std::filesystem::absolute("word_list_test.txt");
        {
            std::ofstream ofs(path, std::ios::binary);
            ofs << SAMPLE;
        }

        WordList fromFile = readWordListFile(path);
        assert_true(fromFile.words.size() == 7, "file should yield seven words");

        curl_global_init(CURL_GLOBAL_DEFAULT);
        WordList fromUrl = fetchWordList("file://" + path.string());
        curl_global_cleanup();
        assert_true(fromUrl.words == fromFile.words, "file:// download should match the file");

        std::filesystem::remove(path);

        bool threw = false;
        try
        {
            readWordListFile("does_not_exist_word_list.txt");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert_true(threw, "missing file should throw runtime_error");
    }

    std::cout << "[OK] WordList tests passed\n";
    return 0;
}
