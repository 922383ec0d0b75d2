#include <gtest/gtest.h>
#include "../shared/cpp/chronicle/include/util.hpp"
#include <sstream>
#include <algorithm>

static std::vector<std::string> words_of(const std::string& s) {
    std::istringstream ss(s);
    std::vector<std::string> out;
    std::string w;
    while (ss >> w) out.push_back(w);
    return out;
}

static std::string numbered_words(int n) {
    std::string s;
    for (int i = 0; i < n; ++i) s += "w" + std::to_string(i) + (i % 7 == 6 ? "\n\n" : "  ");
    return s;
}

TEST(Chunker, WindowsAdvanceByWindowMinusOverlap) {
    auto chunks = chunk_words(numbered_words(10), 4, 1);
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0], "w0 w1 w2 w3");
    EXPECT_EQ(chunks[1], "w3 w4 w5 w6");
    EXPECT_EQ(chunks[2], "w6 w7 w8 w9");
    EXPECT_EQ(chunks[3], "w9");
}

TEST(Chunker, ShortTextIsSingleJoinedWindow) {
    auto chunks = chunk_words("  alpha\tbeta\n gamma  ", 500, 50);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "alpha beta gamma");
}

TEST(Chunker, EmptyOrBlankTextReturnedVerbatim) {
    auto empty = chunk_words("", 5, 1);
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0], "");

    auto blank = chunk_words(" \n\t ", 5, 1);
    ASSERT_EQ(blank.size(), 1u);
    EXPECT_EQ(blank[0], " \n\t ");
}

TEST(Chunker, RejectsDegenerateWindows) {
    EXPECT_THROW(chunk_words("a b c", 3, 3), std::invalid_argument);
    EXPECT_THROW(chunk_words("a b c", 3, 5), std::invalid_argument);
    EXPECT_THROW(chunk_words("a b c", 0, 0), std::invalid_argument);
    EXPECT_THROW(chunk_words("a b c", 3, -1), std::invalid_argument);
}

TEST(Chunker, CoverageReconstructsWordSequence) {
    const int sizes[][2] = {{1, 0}, {2, 1}, {5, 0}, {5, 2}, {7, 6}, {50, 10}, {500, 50}};
    for (int n : {1, 2, 9, 31, 128}) {
        auto text = numbered_words(n);
        auto original = words_of(text);
        for (auto& sz : sizes) {
            int w = sz[0], o = sz[1];
            auto chunks = chunk_words(text, w, o);
            ASSERT_FALSE(chunks.empty());

            // drop the overlapping prefix of every window after the first
            std::vector<std::string> rebuilt;
            for (size_t c = 0; c < chunks.size(); ++c) {
                auto ws = words_of(chunks[c]);
                size_t skip = 0;
                if (c > 0) skip = std::min(ws.size(), std::min((size_t)o, rebuilt.size()));
                rebuilt.insert(rebuilt.end(), ws.begin() + skip, ws.end());
            }
            // trailing windows that lie entirely inside the overlap add nothing new
            if (rebuilt.size() > original.size()) rebuilt.resize(original.size());
            EXPECT_EQ(rebuilt, original) << "n=" << n << " w=" << w << " o=" << o;
        }
    }
}
