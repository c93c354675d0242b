#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <filesystem>

namespace pagesync::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLI::App app{"pagesync: resumable upload of sparse disk images to a page store"};
    app.require_subcommand(1);

    CLIArgs args;
    std::uint32_t parallelism = 0;
    std::uint64_t chunk_size = 0;
    int max_attempts = -1;
    std::string config_path;
    bool no_progress = false;

    auto* upload = app.add_subcommand("upload", "Upload an image, resuming a previous session if possible");
    upload->add_option("-s,--source", args.source, "Path to the source image")
        ->required()
        ->check(CLI::ExistingFile);
    upload->add_option("-d,--store", args.store, "Directory of the destination page store")
        ->required();
    upload->add_option("-o,--object", args.object, "Destination object name (default: source file name)");
    upload->add_option("-p,--parallelism", parallelism, "Number of concurrent upload workers (default: 8 * CPUs)")
        ->check(CLI::PositiveNumber);
    upload->add_option("--chunk-size", chunk_size, "Bytes per upload request (default: 4 MiB)")
        ->check(CLI::PositiveNumber);
    upload->add_option("--max-attempts", max_attempts, "Attempts per request, 0 = retry forever")
        ->check(CLI::NonNegativeNumber);
    upload->add_option("-c,--config", config_path, "Configuration file")
        ->check(CLI::ExistingFile);
    upload->add_flag("--overwrite", args.overwrite, "Recreate the destination object instead of resuming");
    upload->add_flag("--no-progress", no_progress, "Do not render the progress line");
    upload->add_flag("-q,--quiet", args.quiet, "Only report warnings and errors");
    upload->add_flag("-v,--verbose", args.verbose, "Debug logging");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return std::nullopt;
    }

    if (parallelism > 0) args.parallelism = parallelism;
    if (chunk_size > 0) args.chunk_size = chunk_size;
    if (max_attempts >= 0) args.max_attempts = max_attempts;
    if (!config_path.empty()) args.config_path = config_path;
    args.progress = !no_progress;

    if (args.object.empty()) {
        args.object = std::filesystem::path(args.source).filename().string();
    }
    return args;
}

} // namespace pagesync::args_parser
