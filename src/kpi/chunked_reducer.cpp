#include "kpi/chunked_reducer.hpp"
#include <exception>
#include <future>
#include <stdexcept>

namespace ingen {

std::vector<ChunkRange> split_into_chunks(std::size_t n, std::size_t n_chunks) {
    if (n_chunks == 0) {
        throw std::invalid_argument("split_into_chunks: n_chunks must be positive");
    }

    std::vector<ChunkRange> chunks(n_chunks);
    const std::size_t base = n / n_chunks;
    const std::size_t extra = n % n_chunks;

    std::size_t offset = 0;
    for (std::size_t i = 0; i < n_chunks; ++i) {
        std::size_t len = base + (i < extra ? 1 : 0);
        chunks[i] = {offset, offset + len};
        offset += len;
    }
    return chunks;
}

ChunkedReducer::ChunkedReducer(std::size_t n_chunks)
    : n_chunks_(n_chunks)
{
    if (n_chunks_ == 0) {
        throw std::invalid_argument("ChunkedReducer: n_chunks must be positive");
    }
}

double ChunkedReducer::reduce(std::size_t n, const ChunkTask& task) const {
    std::vector<std::future<double>> futures;
    futures.reserve(n_chunks_);

    for (const auto& chunk : split_into_chunks(n, n_chunks_)) {
        if (chunk.size() == 0) continue;
        futures.push_back(std::async(std::launch::async, [&task, chunk]() {
            return task(chunk);
        }));
    }

    // Wait for every task before reporting, so none outlives the call.
    for (auto& f : futures) {
        f.wait();
    }

    double total = 0.0;
    std::exception_ptr failure;
    for (auto& f : futures) {
        try {
            total += f.get();
        } catch (...) {
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
    return total;
}

} // namespace ingen
