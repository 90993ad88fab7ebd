// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/cli/progress_bar.hpp>
#include <spool/core/cache_engine.hpp>
#include <spool/core/error.hpp>
#include <spool/core/format.hpp>
#include <spool/core/url.hpp>
#include <spool/version.hpp>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <sstream>

using namespace spool::core;

namespace chrono = std::chrono;

namespace spool::cli {

namespace {

std::optional<std::uint64_t> parse_number(const char* text) noexcept {
    char* end = nullptr;
    errno = 0;
    auto value = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-') {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

std::expected<std::unique_ptr<CacheEngine>, std::error_code> open_engine(const CliArgs& args) noexcept {
    auto engine = CacheEngine::create(args.config);
    if (!engine) {
        std::cerr << "Error: cannot open cache " << args.config.cache_dir << ": "
                  << engine.error().message() << std::endl;
    }
    return engine;
}

std::string percent_string(double percent) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << percent << "%";
    return ss.str();
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    // Options taking a value; a missing or malformed value is an error
    auto value_of = [&](int& i, std::string_view name) -> const char* {
        if (i + 1 >= argc) {
            args.error = std::string(name) + " needs a value";
            return nullptr;
        }
        return argv[++i];
    };
    auto number_of = [&](int& i, std::string_view name) -> std::optional<std::uint64_t> {
        const char* text = value_of(i, name);
        if (!text) return std::nullopt;
        auto n = parse_number(text);
        if (!n) {
            args.error = std::string("invalid number for ") + std::string(name) + ": " + text;
        }
        return n;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-o" || arg == "--output") {
            if (auto v = value_of(i, arg)) args.output_file = v;
        } else if (arg == "-d" || arg == "--cache-dir") {
            if (auto v = value_of(i, arg)) args.config.cache_dir = v;
        } else if (arg == "--offset") {
            if (auto n = number_of(i, arg)) args.offset = *n;
        } else if (arg == "--length") {
            if (auto n = number_of(i, arg)) args.length = *n;
        } else if (arg == "-t" || arg == "--threshold") {
            if (auto n = number_of(i, arg)) args.config.checkpoint_threshold = *n;
        } else if (arg == "--aggressive") {
            args.config.checkpoint_threshold = AGGRESSIVE_CHECKPOINT_THRESHOLD;
        } else if (arg == "--conservative") {
            args.config.checkpoint_threshold = CONSERVATIVE_CHECKPOINT_THRESHOLD;
        } else if (arg == "--no-incremental") {
            args.config.incremental_caching = false;
        } else if (arg.starts_with("-")) {
            args.error = "unknown option " + arg;
        } else if (args.command == Command::none) {
            if (arg == "get") args.command = Command::get;
            else if (arg == "status") args.command = Command::status;
            else if (arg == "clear") args.command = Command::clear;
            else if (arg == "info") args.command = Command::info;
            else args.error = "unknown command " + arg;
        } else {
            args.urls.push_back(arg);
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult get(const std::string& url, const CliArgs& args) noexcept {
    auto engine = open_engine(args);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    std::string output = args.output_file;
    if (output.empty()) {
        auto parsed = Url::parse(url);
        output = parsed ? parsed->filename() : std::string{};
        if (output.empty()) output = "download";
    }

    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Error: cannot write " << output << std::endl;
        return std::unexpected(make_error_code(CacheErrc::storage_write_error));
    }

    // Size of what is about to arrive, for the progress bar
    std::uint64_t expected_bytes = args.length.value_or(0);
    if (!args.length) {
        if (auto meta = (*engine)->content_info(url); meta && meta->content_length && *meta->content_length > args.offset) {
            expected_bytes = *meta->content_length - args.offset;
        }
    }

    if (args.verbose) {
        std::cout << "Fetching " << url << " from offset " << args.offset;
        if (expected_bytes > 0) std::cout << " (" << format_bytes(expected_bytes) << ")";
        std::cout << " into " << output << std::endl;
    }

    ProgressBar bar(expected_bytes, "Fetching");
    Spinner spinner("Fetching");
    auto started = chrono::steady_clock::now();
    std::uint64_t received = 0;
    bool write_failed = false;

    std::promise<std::error_code> done;
    auto finished = done.get_future();

    auto handle = (*engine)->begin_fetch(url, ByteRange{args.offset, args.length},
        [&](std::uint64_t, std::span<const std::byte> data) {
            if (!write_failed) {
                out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
                write_failed = !out;
            }
            received += data.size();
            if (args.quiet) return;

            auto elapsed = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - started).count();
            std::uint64_t speed = elapsed > 0 ? received * 1000 / static_cast<std::uint64_t>(elapsed) : 0;
            if (expected_bytes > 0) {
                bar.update(received, speed);
            } else {
                spinner.update(received);
            }
        },
        [&](std::error_code ec) { done.set_value(ec); });

    if (!handle) {
        std::cerr << "Error: " << handle.error().message() << std::endl;
        return std::unexpected(handle.error());
    }

    auto ec = finished.get();
    out.close();

    if (!args.quiet) {
        if (ec) {
            expected_bytes > 0 ? bar.clear() : spinner.clear();
        } else {
            expected_bytes > 0 ? bar.finish() : spinner.finish();
        }
    }

    if (ec) {
        std::cerr << "Error: fetch failed: " << ec.message() << " after " << format_bytes(received) << std::endl;
        return std::unexpected(ec);
    }
    if (write_failed || !out) {
        std::cerr << "Error: writing " << output << " failed" << std::endl;
        return std::unexpected(make_error_code(CacheErrc::storage_write_error));
    }

    if (args.verbose) {
        if (auto s = (*engine)->status(url)) {
            std::cout << "Wrote " << format_bytes(received) << " to " << output << ", "
                      << percent_string(s->percent_cached) << " of the resource cached" << std::endl;
        }
    }
    return 0;
}

CliResult status(const std::vector<std::string>& urls, const CliArgs& args) noexcept {
    auto engine = open_engine(args);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    int exit_code = 0;
    for (const auto& url : urls) {
        auto s = (*engine)->status(url);
        if (!s) {
            std::cerr << "Error: " << url << ": " << s.error().message() << std::endl;
            exit_code = 1;
            continue;
        }

        std::cout << "URL: " << url << std::endl;
        std::cout << "Content-Length: "
                  << (s->content_length ? format_bytes(*s->content_length) : std::string("unknown")) << std::endl;
        std::cout << "Cached: " << format_bytes(s->cached_bytes) << " ("
                  << percent_string(s->percent_cached) << ")" << std::endl;
        std::cout << "Complete: " << (s->is_fully_cached ? "yes" : "no") << std::endl;
        if (auto ranges = (*engine)->describe_ranges(url)) {
            std::cout << "Ranges: " << *ranges << std::endl;
        }
    }

    std::cout << "Cache size: " << format_bytes((*engine)->cache_size()) << std::endl;
    return exit_code;
}

CliResult clear(const std::vector<std::string>& urls, const CliArgs& args) noexcept {
    auto engine = open_engine(args);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    if (urls.empty()) {
        if (auto ec = (*engine)->clear_all()) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        if (!args.quiet) std::cout << "Cache cleared" << std::endl;
        return 0;
    }

    for (const auto& url : urls) {
        if (auto ec = (*engine)->clear(url)) {
            std::cerr << "Error: " << url << ": " << ec.message() << std::endl;
            return std::unexpected(ec);
        }
        if (!args.quiet) std::cout << "Cleared " << url << std::endl;
    }
    return 0;
}

CliResult info(const std::string& url, const CliArgs& args) noexcept {
    auto engine = open_engine(args);
    if (!engine) {
        return std::unexpected(engine.error());
    }

    auto meta = (*engine)->content_info(url);
    if (!meta) {
        std::cerr << "Error: " << meta.error().message() << std::endl;
        return std::unexpected(meta.error());
    }

    std::cout << "URL: " << url << std::endl;
    std::cout << "Content-Type: " << meta->content_type.value_or("unknown") << std::endl;
    if (meta->content_length) {
        std::cout << "Content-Length: " << *meta->content_length << " (" << format_bytes(*meta->content_length) << ")" << std::endl;
    } else {
        std::cout << "Content-Length: unknown" << std::endl;
    }
    std::cout << "Accepts-Ranges: " << (meta->supports_range_access ? "yes" : "no") << std::endl;
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Spool " << program_name << " - Progressive range cache\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " get [OPTIONS] <URL>\n";
    std::cout << "  " << program_name << " status [OPTIONS] <URL>...\n";
    std::cout << "  " << program_name << " clear [OPTIONS] [URL]...\n";
    std::cout << "  " << program_name << " info [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar, errors only)\n";
    std::cout << "  -o, --output <FILE>     Save fetched bytes to FILE\n";
    std::cout << "      --offset <N>        First byte to fetch (default: 0)\n";
    std::cout << "      --length <N>        Bytes to fetch (default: to the end)\n";
    std::cout << "  -d, --cache-dir <DIR>   Cache directory (default: " << DEFAULT_CACHE_DIR << ")\n";
    std::cout << "  -t, --threshold <N>     Checkpoint every N bytes (default: 512 KB, min 256 KB)\n";
    std::cout << "      --aggressive        Checkpoint every 256 KB\n";
    std::cout << "      --conservative      Checkpoint every 1 MB\n";
    std::cout << "      --no-incremental    Save only when a fetch ends\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " get https://example.com/video.mp4\n";
    std::cout << "  " << program_name << " get --offset 1048576 --length 65536 -o part.bin https://example.com/video.mp4\n";
    std::cout << "  " << program_name << " status https://example.com/video.mp4\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
    std::cout << "Copyright changcheng967 2026\n";
}

void print_version() noexcept {
    std::cout << "Spool " << spool::version.to_string() << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, libcurl, nlohmann/json, spdlog\n";
}

} // namespace spool::cli
