#include <gtest/gtest.h>
#include "kpi/chunked_reducer.hpp"
#include <atomic>
#include <stdexcept>

using namespace ingen;

TEST(ChunkedReducer, SplitFollowsArraySplit) {
    auto chunks = split_into_chunks(10, 4);
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].size(), 3u);
    EXPECT_EQ(chunks[1].size(), 3u);
    EXPECT_EQ(chunks[2].size(), 2u);
    EXPECT_EQ(chunks[3].size(), 2u);
    EXPECT_EQ(chunks[0].begin, 0u);
    EXPECT_EQ(chunks[3].end, 10u);
    for (std::size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].begin, chunks[i - 1].end);
    }
}

TEST(ChunkedReducer, MoreChunksThanItems) {
    auto chunks = split_into_chunks(3, 16);
    ASSERT_EQ(chunks.size(), 16u);
    std::size_t total = 0;
    for (const auto& c : chunks) total += c.size();
    EXPECT_EQ(total, 3u);
    EXPECT_EQ(chunks[15].size(), 0u);
}

TEST(ChunkedReducer, SumsPartials) {
    ChunkedReducer reducer(5);
    std::atomic<int> calls{0};
    double sum = reducer.reduce(100, [&calls](const ChunkRange& c) {
        ++calls;
        double s = 0.0;
        for (std::size_t i = c.begin; i < c.end; ++i) s += static_cast<double>(i);
        return s;
    });
    EXPECT_DOUBLE_EQ(sum, 4950.0);
    EXPECT_EQ(calls.load(), 5);
}

TEST(ChunkedReducer, EmptyInputSumsToZero) {
    ChunkedReducer reducer;
    EXPECT_EQ(reducer.n_chunks(), kDefaultChunks);
    double sum = reducer.reduce(0, [](const ChunkRange&) -> double {
        throw std::logic_error("no chunk should run");
    });
    EXPECT_DOUBLE_EQ(sum, 0.0);
}

TEST(ChunkedReducer, FailingChunkFailsReduction) {
    ChunkedReducer reducer(4);
    std::atomic<int> finished{0};
    EXPECT_THROW(
        reducer.reduce(8, [&finished](const ChunkRange& c) -> double {
            if (c.begin == 4) throw std::runtime_error("chunk failed");
            ++finished;
            return 1.0;
        }),
        std::runtime_error);
    // Every other chunk still ran to completion before the failure surfaced
    EXPECT_EQ(finished.load(), 3);
}

TEST(ChunkedReducer, ZeroChunksRejected) {
    EXPECT_THROW(ChunkedReducer(0), std::invalid_argument);
    EXPECT_THROW(split_into_chunks(5, 0), std::invalid_argument);
}
