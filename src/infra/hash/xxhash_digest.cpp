#include "xxhash_digest.hpp"
#include <memory>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace pagesync::infra {

auto XXHashDigest::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::SourceRead,
                                         fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)> state{XXH64_createState(), &XXH64_freeState};
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }

    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::SourceRead,
                                         fmt::format("Error reading file: {}", path.string())));
    }

    const XXH64_hash_t hash = XXH64_digest(state.get());
    spdlog::debug("xxh64({}) = {:016x}", path.string(), hash);
    return hash;
}

auto XXHashDigest::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", hash);
}

} // namespace pagesync::infra
