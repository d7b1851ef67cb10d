#define _FILE_OFFSET_BITS 64

#include "filetar/archive_file.hpp"
#include "filetar/progress_sinks.hpp"
#include "system/signals.hpp"
#include "util/config_file.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdio>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <source-file> <archive>\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE      JSON options record (mode, flags, format, post_pack_transform, ...)\n"
        "  -z, --gzip             Gzip the archive before it is written\n"
        "  -n, --rename NAME      Store the entry under NAME instead of the source basename\n"
        "  -p, --progress         Show progress on the console\n"
        "      --progress-file F  Keep the latest progress snapshot as JSON in F\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

enum LongOnly {
    kOptProgressFile = 0x100,
};

} // namespace

int main(int argc, char **argv) {
    filetar::Logger::Instance().ApplyEnvironment();

    std::optional<std::string> config_path;
    std::optional<std::string> rename;
    std::optional<std::string> progress_file;
    bool gzip = false;
    bool console_progress = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"gzip", no_argument, nullptr, 'z'},
        {"rename", required_argument, nullptr, 'n'},
        {"progress", no_argument, nullptr, 'p'},
        {"progress-file", required_argument, nullptr, kOptProgressFile},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:zn:pv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'z':
                gzip = true;
                break;

            case 'n':
                rename = optarg;
                break;

            case 'p':
                console_progress = true;
                break;

            case kOptProgressFile:
                progress_file = optarg;
                break;

            case 'v':
                filetar::Logger::Instance().SetLevel(filetar::LogLevel::Debug);
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (argc - optind != 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    std::vector<nlohmann::json> args = {argv[optind], argv[optind + 1]};

    nlohmann::json record = nlohmann::json::object();
    if (config_path) {
        auto loaded = filetar::config::LoadJsonObjectFromFile(*config_path);
        if (!loaded) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", loaded.error().c_str());
            return kExitFailure;
        }
        record = std::move(*loaded);
    }
    if (gzip) {
        if (record.contains("post_pack_transform")) {
            std::fprintf(stderr, "ERROR: --gzip conflicts with post_pack_transform in %s\n",
                         config_path->c_str());
            return kExitUsage;
        }
        record["post_pack_transform"] = "gzip";
    }
    if (!record.empty()) {
        args.push_back(std::move(record));
    }

    filetar::ArchiveRequest request;
    if (auto r = filetar::ValidateArguments(args, request); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitUsage;
    }
    if (rename) {
        const std::string name = *rename;
        request.options.map_header = [name](filetar::EntryHeader &h) { h.name = name; };
    }
    const std::string destination = request.destination_path;

    boost::asio::io_context io;
    filetar::ArchiveOperation op(io, std::move(request));

    std::vector<std::unique_ptr<filetar::IProgress>> sinks;
    if (console_progress) {
        sinks.push_back(std::make_unique<filetar::ConsoleProgressSink>());
    }
    if (progress_file) {
        sinks.push_back(std::make_unique<filetar::FileProgressSink>(*progress_file));
    }

    int exit_code = 0;
    std::optional<filetar::CancelSignals> signals;

    filetar::Observer observer;
    observer.next = [&sinks](const filetar::ProgressEvent &e) {
        for (auto &s : sinks) {
            s->OnProgress(e);
        }
    };
    observer.error = [&](const filetar::Result &r) {
        filetar::ClearProgressLine();
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        exit_code = kExitFailure;
        signals->Stop();
    };
    observer.complete = [&]() {
        filetar::ClearProgressLine();
        LogInfo("archive written: %s", destination.c_str());
        signals->Stop();
    };

    filetar::Subscription sub;
    signals.emplace(io, [&](int signo) {
        LogInfo("signal %d received, cancelling", signo);
        sub.Cancel();
        exit_code = kExitCancelled;
        signals->Stop();
    });

    sub = op.Subscribe(std::move(observer));
    io.run();

    filetar::ClearProgressLine();
    return exit_code;
}
