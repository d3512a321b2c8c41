// partpipe command line driver.
//
//   tar -cf - dir | partpipe backup --dest /mnt/usb --name dir --size 3.5
//   partpipe extract --source /mnt/usb/dir.tar.gz.part_000 | tar -xf -
//   partpipe verify --manifest /mnt/usb/dir.tar.gz.manifest

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "partpipe/core/config.hpp"
#include "partpipe/pipeline.hpp"
#include "partpipe/stream/parts_manifest.hpp"

using namespace partpipe;

namespace {

struct Args {
    std::string command;
    std::string dest;
    std::string name;
    std::string source;
    std::string out;
    std::string manifest;
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> settings; // applied after env and config file
    bool write_manifest{false};
    bool verbose{false};
};

void print_usage() {
    std::cerr << "partpipe: split, parallel-compress and reassemble byte streams\n"
              << "Usage:\n"
              << "  partpipe backup --dest DIR --name NAME [--size GB] [--level N] [--workers N]\n"
              << "                  [--chunk-mb N] [--codec gzip|zstd] [--config FILE] [--manifest] [--verbose]\n"
              << "      reads the archive stream from stdin; --size 0 writes a single file\n"
              << "  partpipe extract --source PATTERN [--out FILE] [--verbose]\n"
              << "  partpipe verify --manifest FILE\n";
}

int report(const core::error& e) {
    std::cerr << "error: " << e.component << ": " << e.message << "\n";
    return 1;
}

// "--key value" or "--key=value"
std::optional<std::string> take_value(std::string_view a, std::string_view key, int& i, int argc, char** argv, bool& missing) {
    if (a == key) {
        if (i + 1 >= argc) { missing = true; return std::nullopt; }
        return std::string(argv[++i]);
    }
    if (a.size() > key.size() && a.rfind(key, 0) == 0 && a[key.size()] == '=') {
        return std::string(a.substr(key.size() + 1));
    }
    return std::nullopt;
}

std::optional<Args> parse_args(int argc, char** argv) {
    if (argc < 2) return std::nullopt;
    Args args;
    args.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        bool missing = false;
        if (a == "--help" || a == "-h") return std::nullopt;
        if (a == "--manifest" && args.command != "verify") { args.write_manifest = true; continue; }
        else if (auto v = take_value(a, "--dest", i, argc, argv, missing)) args.dest = *v;
        else if (auto v = take_value(a, "--name", i, argc, argv, missing)) args.name = *v;
        else if (auto v = take_value(a, "--source", i, argc, argv, missing)) args.source = *v;
        else if (auto v = take_value(a, "--out", i, argc, argv, missing)) args.out = *v;
        else if (auto v = take_value(a, "--manifest", i, argc, argv, missing)) args.manifest = *v;
        else if (auto v = take_value(a, "--config", i, argc, argv, missing)) args.config_file = *v;
        else if (auto v = take_value(a, "--size", i, argc, argv, missing)) args.settings.emplace_back("split_size_gb", *v);
        else if (auto v = take_value(a, "--level", i, argc, argv, missing)) args.settings.emplace_back("compression_level", *v);
        else if (auto v = take_value(a, "--workers", i, argc, argv, missing)) args.settings.emplace_back("workers", *v);
        else if (auto v = take_value(a, "--codec", i, argc, argv, missing)) args.settings.emplace_back("codec", *v);
        else if (auto v = take_value(a, "--pending", i, argc, argv, missing)) args.settings.emplace_back("pending_threshold", *v);
        else if (auto v = take_value(a, "--chunk-mb", i, argc, argv, missing)) {
            std::uint64_t mb = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), mb);
            constexpr std::uint64_t kMaxChunkMb = std::numeric_limits<std::size_t>::max() >> 20;
            if (ec != std::errc() || ptr != v->data() + v->size() || mb == 0 || mb > kMaxChunkMb) {
                std::cerr << "invalid --chunk-mb \"" << *v << "\"\n";
                return std::nullopt;
            }
            args.settings.emplace_back("chunk_bytes", std::to_string(mb * 1024ull * 1024ull));
        }
        else if (a == "--verbose" || a == "-v") args.verbose = true;
        else {
            std::cerr << (missing ? "missing value for " : "unknown option ") << a << "\n";
            return std::nullopt;
        }
    }
    return args;
}

int run_backup(const Args& args) {
    if (args.dest.empty() || args.name.empty()) {
        print_usage();
        return 2;
    }
    pipeline::BackupOptions opts{};
    opts.dir = args.dest;
    opts.name = args.name;
    opts.write_manifest = args.write_manifest;
    if (auto r = core::apply_env(opts.config); !r) return report(r.error());
    if (!args.config_file.empty()) {
        if (auto r = core::load_config_file(args.config_file, opts.config); !r) return report(r.error());
    }
    for (const auto& [k, v] : args.settings) {
        if (auto r = core::apply_setting(k, v, opts.config); !r) return report(r.error());
    }
    if (args.verbose) {
        opts.on_segment_closed = [](const stream::SegmentInfo& s) {
            std::cerr << "part " << s.index << ": " << s.path.string() << " (" << s.bytes << " bytes)\n";
        };
    }

    std::ios::sync_with_stdio(false);
    auto rep = pipeline::backup_stream(std::cin, opts);
    if (!rep) return report(rep.error());

    const double ratio = rep->bytes_in == 0 ? 0.0
        : 100.0 * static_cast<double>(rep->bytes_out) / static_cast<double>(rep->bytes_in);
    std::cerr << "parts=" << rep->parts << " in=" << rep->bytes_in << " out=" << rep->bytes_out
              << " ratio=" << std::fixed << std::setprecision(1) << ratio << "%\n";
    return 0;
}

int run_extract(const Args& args) {
    if (args.source.empty()) {
        print_usage();
        return 2;
    }
    pipeline::RestoreOptions opts{};
    std::ofstream file;
    std::ostream* out = &std::cout;
    if (!args.out.empty()) {
        file.open(args.out, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return report(core::error{core::error_code::io_failed, "cannot open " + args.out, "pipeline"});
        }
        out = &file;
    }
    std::ios::sync_with_stdio(false);
    auto rep = pipeline::restore_stream(args.source, *out, opts);
    if (!rep) return report(rep.error());
    if (args.verbose) {
        std::cerr << "parts=" << rep->parts << " in=" << rep->bytes_in << " out=" << rep->bytes_out << "\n";
    }
    return 0;
}

int run_verify(const Args& args) {
    if (args.manifest.empty()) {
        print_usage();
        return 2;
    }
    auto m = stream::verify_parts_manifest(args.manifest);
    if (!m) return report(m.error());
    std::cerr << "ok: " << m->entries.size() << " parts, " << m->total_bytes() << " bytes\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 2;
    }
    if (args->verbose) {
        ::setenv("PARTPIPE_DEBUG", "1", 1);
    }
    if (args->command == "backup") return run_backup(*args);
    if (args->command == "extract") return run_extract(*args);
    if (args->command == "verify") return run_verify(*args);
    std::cerr << "unknown command " << args->command << "\n";
    print_usage();
    return 2;
}
