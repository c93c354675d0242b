#pragma once

#include <filesystem>
#include <expected>
#include <fstream>
#include <string>
#include <vector>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace pagesync::infra {

class XXHashDigest {
public:
    // Вычисляет xxHash64 для файла
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    // 16 hex digits, lower case
    static auto to_hex(XXH64_hash_t hash) -> std::string;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace pagesync::infra
