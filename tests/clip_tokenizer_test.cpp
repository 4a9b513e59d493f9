#include "test_base.hpp"
#include "core/embedding/clip_tokenizer.hpp"
#include "core/error_types.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

class ClipTokenizerTest : public TestBase
{
protected:
    std::string writeTokenizer(const json &merges, bool specials_in_vocab = true)
    {
        json vocab = {{"a", 1},     {"b", 2},     {"a</w>", 3}, {"b</w>", 4}, {"ab</w>", 5},
                      {"!</w>", 6}, {"1</w>", 7}, {"2</w>", 8}, {"'", 9},     {"s</w>", 12}, {"'s</w>", 13}};
        json added = json::array();
        if (specials_in_vocab)
        {
            vocab["<|startoftext|>"] = 10;
            vocab["<|endoftext|>"] = 11;
        }
        else
        {
            added.push_back({{"id", 100}, {"content", "<|startoftext|>"}});
            added.push_back({{"id", 101}, {"content", "<|endoftext|>"}});
        }

        json tokenizer = {{"model", {{"type", "BPE"}, {"vocab", vocab}, {"merges", merges}}},
                          {"added_tokens", added}};
        writeFile("tokenizer.json", tokenizer.dump());
        return testPath("tokenizer.json");
    }
};

TEST_F(ClipTokenizerTest, EncodesFramedAndPadded)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({"a b</w>"})));
    auto ids = tokenizer.encode("AB   ab");

    ASSERT_EQ(ids.size(), ClipTokenizer::kContextLength);
    EXPECT_EQ(ids[0], 10);
    EXPECT_EQ(ids[1], 5);
    EXPECT_EQ(ids[2], 5);
    EXPECT_EQ(ids[3], 11);
    for (size_t i = 4; i < ids.size(); ++i)
        EXPECT_EQ(ids[i], tokenizer.padId());
}

TEST_F(ClipTokenizerTest, SplitsLettersDigitsAndPunctuation)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({"a b</w>"})));

    EXPECT_EQ(tokenizer.tokenize("ab!"), (std::vector<int64_t>{5, 6}));
    EXPECT_EQ(tokenizer.tokenize("12"), (std::vector<int64_t>{7, 8}));
    EXPECT_EQ(tokenizer.tokenize("a b"), (std::vector<int64_t>{3, 4}));
}

TEST_F(ClipTokenizerTest, WithoutMergesWordsStayAsBytes)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array()));
    EXPECT_EQ(tokenizer.tokenize("ab"), (std::vector<int64_t>{1, 4}));
}

TEST_F(ClipTokenizerTest, UnknownSymbolsAreDropped)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({"a b</w>"})));
    EXPECT_TRUE(tokenizer.tokenize("c").empty());
    EXPECT_EQ(tokenizer.tokenize("c ab"), (std::vector<int64_t>{5}));
}

TEST_F(ClipTokenizerTest, LongTextIsTruncated)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({"a b</w>"})));
    std::string text;
    for (int i = 0; i < 100; ++i)
        text += "ab ";

    auto ids = tokenizer.encode(text);
    ASSERT_EQ(ids.size(), ClipTokenizer::kContextLength);
    EXPECT_EQ(ids.front(), 10);
    EXPECT_EQ(ids[ClipTokenizer::kContextLength - 2], 5);
    EXPECT_EQ(ids.back(), 11);
}

TEST_F(ClipTokenizerTest, ArrayMergesAndAddedTokens)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({json::array({"a", "b</w>"})}), false));

    EXPECT_EQ(tokenizer.startOfTextId(), 100);
    EXPECT_EQ(tokenizer.endOfTextId(), 101);
    EXPECT_EQ(tokenizer.tokenize("ab"), (std::vector<int64_t>{5}));
}

TEST_F(ClipTokenizerTest, ContractionsSplitOff)
{
    ClipTokenizer tokenizer(writeTokenizer(json::array({"' s</w>"})));
    EXPECT_EQ(tokenizer.tokenize("a's"), (std::vector<int64_t>{3, 13}));
}

TEST_F(ClipTokenizerTest, BadFilesThrowResourceError)
{
    EXPECT_THROW({ ClipTokenizer tokenizer(testPath("missing.json")); }, ResourceError);

    writeFile("broken.json", "{ not json");
    EXPECT_THROW({ ClipTokenizer tokenizer(testPath("broken.json")); }, ResourceError);

    writeFile("no_merges.json", R"({"model": {"vocab": {"a": 1}}})");
    EXPECT_THROW({ ClipTokenizer tokenizer(testPath("no_merges.json")); }, ResourceError);
}
