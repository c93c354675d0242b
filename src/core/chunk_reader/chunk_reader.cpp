#include "chunk_reader.hpp"
#include <spdlog/spdlog.h>

namespace pagesync::core {

ChunkReader::ChunkReader(adapters::SourceStream& stream, WorkList ranges, std::size_t capacity)
    : stream_(stream)
    , ranges_(std::move(ranges))
    , chunks_(capacity)
{}

void ChunkReader::start() {
    thread_ = std::jthread([this](std::stop_token st) { run_(st); });
}

void ChunkReader::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
    }
}

void ChunkReader::run_(std::stop_token st) {
    for (const auto& r : ranges_) {
        Chunk chunk{r, std::vector<std::byte>(static_cast<std::size_t>(r.length()))};

        auto res = stream_.seek(r.start());
        if (res) {
            res = adapters::read_exact(stream_, chunk.data);
        }
        if (!res) {
            spdlog::debug("Chunk reader failed at {}: {}", r.to_string(), res.error().message);
            (void)errors_.send(std::move(res.error()));
            errors_.close();
            chunks_.close();
            return;
        }

        if (!chunks_.send(std::move(chunk), st)) {
            // Остановлены извне: потребитель больше не ждёт чанков
            break;
        }
    }
    chunks_.close();
    errors_.close();
}

} // namespace pagesync::core
