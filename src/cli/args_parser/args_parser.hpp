#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace pagesync::args_parser {
    struct CLIArgs
{
    std::string source;                        // --source IMAGE
    std::string store;                         // --store DIR
    std::string object;                        // --object NAME (по умолчанию имя файла)
    std::optional<std::string> config_path;    // --config FILE
    std::optional<std::uint32_t> parallelism;  // -p, --parallelism=N
    std::optional<std::uint64_t> chunk_size;   // --chunk-size=BYTES
    std::optional<int> max_attempts;           // --max-attempts=N (0 = без ограничения)
    bool overwrite{false};                     // --overwrite
    bool progress{true};                       // --no-progress
    bool quiet{false};                         // -q, --quiet
    bool verbose{false};                       // -v, --verbose
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// std::nullopt after --help or a parse error (already reported).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace pagesync::args_parser
