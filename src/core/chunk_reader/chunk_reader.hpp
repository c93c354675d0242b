#pragma once

#include <cstddef>
#include <thread>
#include <vector>
#include "adapters/source_stream.hpp"
#include "core/range/range_set.hpp"
#include "core/reconciler/reconciler.hpp"
#include "infra/channel/channel.hpp"
#include "infra/error_handler/error.hpp"

namespace pagesync::core {

struct Chunk {
    ByteRange range;
    std::vector<std::byte> data;
};

// Single producer: reads the ranges in order and hands each one over as a
// Chunk. Exactly one of two outcomes:
//   - every range was read, chunks() is closed, errors() is empty;
//   - a seek/read failed, the error is on errors() and chunks() is closed
//     right after it. No partial chunk is ever emitted.
class ChunkReader {
public:
    ChunkReader(adapters::SourceStream& stream, WorkList ranges, std::size_t capacity = 0);
    ~ChunkReader() = default;

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    void start();
    void stop();

    [[nodiscard]] auto chunks() -> infra::Channel<Chunk>& { return chunks_; }
    [[nodiscard]] auto errors() -> infra::Channel<infra::Error>& { return errors_; }

private:
    void run_(std::stop_token st);

    adapters::SourceStream& stream_;
    const WorkList ranges_;
    infra::Channel<Chunk> chunks_;
    infra::Channel<infra::Error> errors_{1};
    std::jthread thread_; // последним: join до разрушения каналов
};

} // namespace pagesync::core
