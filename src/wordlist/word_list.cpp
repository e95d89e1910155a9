// src/wordlist/word_list.cpp
#include "wordlist/word_list.hpp"

#include <curl/curl.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include "common/utf8.hpp"
#include "trie_set/invalid_character_error.hpp"

namespace trieset
{

    static std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
            s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
            s.remove_suffix(1);
        return s;
    }

    WordList parseWordList(std::istream &in)
    {
        WordList out;
        std::string line;
        size_t lineNo = 0;
        std::u32string word;

        while (std::getline(in, line))
        {
            ++lineNo;
            const std::string_view s = trim(line);
            if (s.empty() || s.front() == '#')
                continue;

            if (!utf8ToU32(s, word))
            {
                out.badUtf8Lines.push_back(lineNo);
                continue;
            }
            out.words.push_back(word);
        }
        return out;
    }

    WordList readWordListFile(const std::filesystem::path &path)
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs)
            throw std::runtime_error("Failed to open: " + path.string());
        return parseWordList(ifs);
    }

    // --------------------
    // libcurl: write callback
    // --------------------
    static size_t writeToString(void *ptr, size_t size, size_t nmemb, void *userdata)
    {
        std::string *out = static_cast<std::string *>(userdata);
        const size_t bytes = size * nmemb;
        out->append(static_cast<const char *>(ptr), bytes);
        return bytes;
    }

    std::string downloadText(const std::string &url)
    {
        CURL *curl = curl_easy_init();
        if (!curl)
            throw std::runtime_error("curl_easy_init failed");

        std::string body;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 300L);

        const CURLcode res = curl_easy_perform(curl);

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

        curl_easy_cleanup(curl);

        if (res != CURLE_OK)
            throw std::runtime_error(std::string("Download failed: ") + curl_easy_strerror(res));
        // file:// transfers report no status code
        if (httpCode != 0 && (httpCode < 200 || httpCode >= 300))
            throw std::runtime_error("HTTP error: " + std::to_string(httpCode) + " (" + url + ")");
        return body;
    }

    WordList fetchWordList(const std::string &url)
    {
        std::istringstream in(downloadText(url));
        return parseWordList(in);
    }

    AddReport addWords(TrieSet &set, const std::vector<std::u32string> &words)
    {
        AddReport report;
        for (const auto &w : words)
        {
            try
            {
                if (set.add(w))
                    ++report.added;
                else
                    ++report.duplicates;
            }
            catch (const InvalidCharacterError &e)
            {
                report.rejected.push_back(RejectedWord{w, e.character(), e.position()});
            }
        }
        return report;
    }

} // namespace trieset
