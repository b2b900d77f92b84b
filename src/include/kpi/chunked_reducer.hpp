#pragma once
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace ingen {

constexpr std::size_t kDefaultChunks = 16;

// Half-open index range [begin, end)
struct ChunkRange {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t size() const { return end - begin; }
};

// Splits [0, n) into n_chunks contiguous ranges. The first n % n_chunks ranges
// hold one extra element; trailing ranges are empty when n < n_chunks.
std::vector<ChunkRange> split_into_chunks(std::size_t n, std::size_t n_chunks);

// Parallel map-reduce over contiguous chunks of an index range.
// One asynchronous task per non-empty chunk; partial results are summed.
class ChunkedReducer {
public:
    using ChunkTask = std::function<double(const ChunkRange&)>;

    explicit ChunkedReducer(std::size_t n_chunks = kDefaultChunks);

    std::size_t n_chunks() const { return n_chunks_; }

    // Blocks until every task has finished. If any task throws, the first
    // failure in chunk order is rethrown and no partial sum is returned.
    double reduce(std::size_t n, const ChunkTask& task) const;

private:
    std::size_t n_chunks_;
};

} // namespace ingen
