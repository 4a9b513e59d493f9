#include "core/embedding/clip_tokenizer.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>

using json = nlohmann::json;

namespace
{
    const char *kStartOfText = "<|startoftext|>";
    const char *kEndOfText = "<|endoftext|>";
    const char *kEndOfWord = "</w>";

    std::string encodeUtf8(int codepoint)
    {
        std::string out;
        if (codepoint < 0x80)
        {
            out += static_cast<char>(codepoint);
        }
        else if (codepoint < 0x800)
        {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        return out;
    }

    // GPT-2 style reversible byte to printable-character table
    std::vector<std::string> buildByteEncoder()
    {
        std::vector<int> bytes;
        for (int b = '!'; b <= '~'; ++b)
            bytes.push_back(b);
        for (int b = 0xA1; b <= 0xAC; ++b)
            bytes.push_back(b);
        for (int b = 0xAE; b <= 0xFF; ++b)
            bytes.push_back(b);

        std::vector<int> codepoints = bytes;
        int extra = 0;
        for (int b = 0; b < 256; ++b)
        {
            if (std::find(bytes.begin(), bytes.end(), b) == bytes.end())
            {
                bytes.push_back(b);
                codepoints.push_back(256 + extra++);
            }
        }

        std::vector<std::string> encoder(256);
        for (size_t i = 0; i < bytes.size(); ++i)
            encoder[bytes[i]] = encodeUtf8(codepoints[i]);
        return encoder;
    }

    bool isLetter(unsigned char c)
    {
        return std::isalpha(c) || c >= 0x80;
    }

    std::string pairKey(const std::string &left, const std::string &right)
    {
        return left + "\n" + right;
    }
}

ClipTokenizer::ClipTokenizer(const std::string &tokenizer_json_path)
    : byte_encoder_(buildByteEncoder())
{
    std::ifstream file(tokenizer_json_path);
    if (!file.is_open())
    {
        throw ResourceError("Could not open tokenizer file: " + tokenizer_json_path);
    }

    json tokenizer_json;
    try
    {
        tokenizer_json = json::parse(file);
    }
    catch (const json::parse_error &e)
    {
        throw ResourceError("Malformed tokenizer file " + tokenizer_json_path + ": " + e.what());
    }

    if (!tokenizer_json.contains("model") || !tokenizer_json["model"].contains("vocab") ||
        !tokenizer_json["model"].contains("merges"))
    {
        throw ResourceError("Tokenizer file lacks model.vocab or model.merges: " + tokenizer_json_path);
    }

    for (const auto &entry : tokenizer_json["model"]["vocab"].items())
    {
        vocab_[entry.key()] = entry.value().get<int64_t>();
    }

    int rank = 0;
    for (const auto &merge : tokenizer_json["model"]["merges"])
    {
        std::string left;
        std::string right;
        if (merge.is_string())
        {
            const std::string text = merge.get<std::string>();
            auto space = text.find(' ');
            if (space == std::string::npos)
                continue;
            left = text.substr(0, space);
            right = text.substr(space + 1);
        }
        else if (merge.is_array() && merge.size() == 2)
        {
            left = merge[0].get<std::string>();
            right = merge[1].get<std::string>();
        }
        else
        {
            continue;
        }
        merge_ranks_.emplace(pairKey(left, right), rank++);
    }

    if (tokenizer_json.contains("added_tokens") && tokenizer_json["added_tokens"].is_array())
    {
        for (const auto &token : tokenizer_json["added_tokens"])
        {
            const std::string content = token.value("content", "");
            if (!token.contains("id"))
                continue;
            if (content == kStartOfText)
                sot_id_ = token["id"].get<int64_t>();
            else if (content == kEndOfText)
                eot_id_ = token["id"].get<int64_t>();
        }
    }
    auto sot = vocab_.find(kStartOfText);
    if (sot != vocab_.end())
        sot_id_ = sot->second;
    auto eot = vocab_.find(kEndOfText);
    if (eot != vocab_.end())
        eot_id_ = eot->second;

    if (tokenizer_json.contains("padding") && tokenizer_json["padding"].is_object())
    {
        pad_id_ = tokenizer_json["padding"].value("pad_id", pad_id_);
    }

    Logger::info("CLIP tokenizer loaded: " + std::to_string(vocab_.size()) + " tokens, " +
                 std::to_string(merge_ranks_.size()) + " merges");
}

std::string ClipTokenizer::normalize(const std::string &text)
{
    std::string out;
    bool pending_space = false;
    for (unsigned char c : text)
    {
        if (std::isspace(c))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
        {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
    }
    return out;
}

std::vector<std::string> ClipTokenizer::splitWords(const std::string &text) const
{
    static const std::vector<std::string> contractions = {"'s", "'t", "'re", "'ve", "'m", "'ll", "'d"};

    std::vector<std::string> words;
    const size_t n = text.size();
    size_t i = 0;
    while (i < n)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isspace(c))
        {
            ++i;
            continue;
        }

        if (c == '\'')
        {
            bool matched = false;
            for (const auto &contraction : contractions)
            {
                if (text.compare(i, contraction.size(), contraction) == 0)
                {
                    words.push_back(contraction);
                    i += contraction.size();
                    matched = true;
                    break;
                }
            }
            if (matched)
                continue;
        }

        size_t j = i + 1;
        if (isLetter(c))
        {
            while (j < n && isLetter(static_cast<unsigned char>(text[j])))
                ++j;
        }
        else if (!std::isdigit(c))
        {
            while (j < n)
            {
                unsigned char d = static_cast<unsigned char>(text[j]);
                if (std::isspace(d) || isLetter(d) || std::isdigit(d))
                    break;
                ++j;
            }
        }
        words.push_back(text.substr(i, j - i));
        i = j;
    }
    return words;
}

std::vector<std::string> ClipTokenizer::bpe(const std::string &word) const
{
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto cached = cache_.find(word);
        if (cached != cache_.end())
            return cached->second;
    }

    std::vector<std::string> symbols;
    for (unsigned char byte : word)
        symbols.push_back(byte_encoder_[byte]);
    if (symbols.empty())
        return symbols;
    symbols.back() += kEndOfWord;

    while (symbols.size() > 1)
    {
        int best_rank = INT_MAX;
        size_t best_index = 0;
        for (size_t i = 0; i + 1 < symbols.size(); ++i)
        {
            auto it = merge_ranks_.find(pairKey(symbols[i], symbols[i + 1]));
            if (it != merge_ranks_.end() && it->second < best_rank)
            {
                best_rank = it->second;
                best_index = i;
            }
        }
        if (best_rank == INT_MAX)
            break;

        const std::string left = symbols[best_index];
        const std::string right = symbols[best_index + 1];
        std::vector<std::string> merged;
        merged.reserve(symbols.size());
        for (size_t i = 0; i < symbols.size(); ++i)
        {
            if (i + 1 < symbols.size() && symbols[i] == left && symbols[i + 1] == right)
            {
                merged.push_back(left + right);
                ++i;
            }
            else
            {
                merged.push_back(symbols[i]);
            }
        }
        symbols.swap(merged);
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.emplace(word, symbols);
    return symbols;
}

std::vector<int64_t> ClipTokenizer::tokenize(const std::string &text) const
{
    std::vector<int64_t> ids;
    for (const auto &word : splitWords(normalize(text)))
    {
        for (const auto &symbol : bpe(word))
        {
            auto it = vocab_.find(symbol);
            if (it != vocab_.end())
            {
                ids.push_back(it->second);
            }
            else
            {
                Logger::debug("Token not in CLIP vocabulary, dropped: " + symbol);
            }
        }
    }
    return ids;
}

std::vector<int64_t> ClipTokenizer::encode(const std::string &text) const
{
    std::vector<int64_t> body = tokenize(text);
    if (body.size() > kContextLength - 2)
    {
        body.resize(kContextLength - 2);
    }

    std::vector<int64_t> ids;
    ids.reserve(kContextLength);
    ids.push_back(sot_id_);
    ids.insert(ids.end(), body.begin(), body.end());
    ids.push_back(eot_id_);
    ids.resize(kContextLength, pad_id_);
    return ids;
}
