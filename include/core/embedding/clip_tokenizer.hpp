#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief CLIP byte-level BPE tokenizer loaded from a HuggingFace tokenizer.json
 */
class ClipTokenizer
{
public:
    static constexpr std::size_t kContextLength = 77;

    /**
     * @param tokenizer_json_path File with model.vocab and model.merges
     * @throws ResourceError when the file is missing or malformed
     */
    explicit ClipTokenizer(const std::string &tokenizer_json_path);

    /**
     * @brief Tokenize one text into a fixed-length id sequence
     * @return <|startoftext|>, up to 75 BPE ids, <|endoftext|>, then padding to kContextLength
     */
    std::vector<int64_t> encode(const std::string &text) const;

    /**
     * @brief BPE ids of a text without framing or padding
     */
    std::vector<int64_t> tokenize(const std::string &text) const;

    int64_t startOfTextId() const { return sot_id_; }
    int64_t endOfTextId() const { return eot_id_; }
    int64_t padId() const { return pad_id_; }
    std::size_t vocabSize() const { return vocab_.size(); }

private:
    std::vector<std::string> splitWords(const std::string &text) const;
    std::vector<std::string> bpe(const std::string &word) const;
    static std::string normalize(const std::string &text);

    std::unordered_map<std::string, int64_t> vocab_;
    std::unordered_map<std::string, int> merge_ranks_;
    std::vector<std::string> byte_encoder_; // byte value -> UTF-8 of its printable stand-in

    int64_t sot_id_ = 49406;
    int64_t eot_id_ = 49407;
    int64_t pad_id_ = 0;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, std::vector<std::string>> cache_;
};
