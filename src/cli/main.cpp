#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>
#include <type_traits>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <segloader/segloader.hpp>

using namespace segloader;

namespace
{
    volatile std::sig_atomic_t interrupt_requested = 0;

    extern "C" void on_interrupt(int)
    {
        interrupt_requested = 1;
    }
}

struct CliOptions
{
    std::string source;
    std::string output = ".";
    std::string filename;
    std::size_t connections = 8;
    std::string chunk_size = "4MB";
    std::string limit;
    std::string proxy;
    std::size_t retries = 5;
    long connect_timeout = 15;
    long read_timeout = 60;
    std::string sha256;
    std::vector<std::string> headers;
    bool quiet = false;
    bool json = false;
};

// Options from the YAML file fill whatever was not given on the command line.
void
load_options_file(const std::string& file, const CLI::App& app, CliOptions& opts)
{
    spdlog::info("Loading options from {}", file);
    YAML::Node config = YAML::LoadFile(file);

    auto apply = [&](const char* key, const char* flag, auto& target)
    {
        using T = std::decay_t<decltype(target)>;
        if (config[key] && app.count(flag) == 0)
        {
            target = config[key].as<T>();
        }
    };

    apply("source", "source", opts.source);
    apply("output", "--output", opts.output);
    apply("filename", "--filename", opts.filename);
    apply("connections", "--connections", opts.connections);
    apply("chunk-size", "--chunk-size", opts.chunk_size);
    apply("limit", "--limit", opts.limit);
    apply("proxy", "--proxy", opts.proxy);
    apply("retries", "--retries", opts.retries);
    apply("connect-timeout", "--connect-timeout", opts.connect_timeout);
    apply("read-timeout", "--read-timeout", opts.read_timeout);
    apply("sha256", "--sha256", opts.sha256);
    apply("headers", "--header", opts.headers);
}

tl::expected<TransferSpec, TransferError>
make_spec(const CliOptions& opts)
{
    TransferSpec spec;
    spec.url = opts.source;
    spec.destination = fs::absolute(opts.output);
    spec.filename = opts.filename;
    spec.concurrency = opts.connections;
    spec.headers = opts.headers;
    spec.proxy = opts.proxy.empty() ? get_env("SEGLOADER_PROXY", "") : opts.proxy;
    spec.retries = opts.retries;
    spec.connect_timeout = std::chrono::seconds(opts.connect_timeout);
    spec.read_timeout = std::chrono::seconds(opts.read_timeout);
    if (!opts.sha256.empty())
        spec.expected_sha256 = opts.sha256;

    auto chunk_size = parse_size(opts.chunk_size);
    if (!chunk_size)
        return tl::unexpected(chunk_size.error());
    spec.chunk_size = chunk_size.value();

    auto limit = parse_size(opts.limit);
    if (!limit)
        return tl::unexpected(limit.error());
    spec.rate_limit = limit.value();

    return spec;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "segloader: segmented, resumable HTTP downloads" };

    CliOptions opts;
    std::string file;
    bool verbose = false;
    bool disable_ssl = false;

    app.add_option("source", opts.source, "URL to download");
    app.add_option("-o,--output", opts.output, "Output file or directory");
    app.add_option("-O,--filename", opts.filename, "Output file name inside the output directory");
    app.add_option("-c,--connections", opts.connections, "Number of concurrent connections");
    app.add_option("--chunk-size", opts.chunk_size, "Segment size, e.g. 4MB");
    app.add_option("--limit", opts.limit, "Download rate limit in bytes per second, e.g. 500KB");
    app.add_option("--proxy", opts.proxy, "HTTP/HTTPS proxy URL (default: $SEGLOADER_PROXY)");
    app.add_option("--retries", opts.retries, "Retry attempts per segment");
    app.add_option("--connect-timeout", opts.connect_timeout, "Connection timeout in seconds");
    app.add_option("--read-timeout", opts.read_timeout, "Read timeout in seconds");
    app.add_option("--sha256", opts.sha256, "Expected SHA-256 of the file");
    app.add_option("-H,--header", opts.headers, "Extra request header 'Name: value'");
    app.add_option("-f", file, "YAML file from which to read options");
    app.add_flag("-q,--quiet", opts.quiet, "Suppress progress output");
    app.add_flag("--json", opts.json, "Report progress as JSON lines on stdout");
    app.add_flag("-v", verbose, "Enable verbose output");
    app.add_flag("-k", disable_ssl, "Disable SSL verification");

    CLI11_PARSE(app, argc, argv);

    segloader::Context ctx;
    if (verbose)
    {
        ctx.set_verbosity(1);
    }
    ctx.disable_ssl = disable_ssl;

    if (!file.empty())
    {
        try
        {
            load_options_file(file, app, opts);
        }
        catch (const YAML::Exception& e)
        {
            spdlog::critical("Could not read {}: {}", file, e.what());
            return 1;
        }
    }

    if (opts.source.empty())
    {
        std::cerr << "Error: a source is required" << std::endl;
        return 1;
    }

    auto spec = make_spec(opts);
    if (!spec)
    {
        std::cerr << "Error: " << describe(spec.error()) << std::endl;
        return 1;
    }

    std::unique_ptr<ProgressObserver> observer;
    if (opts.json)
        observer = std::make_unique<JsonProgressSink>(std::cout);
    else if (!opts.quiet && !verbose)
        observer = std::make_unique<ConsoleProgressBar>();

    auto transfer = make_transfer(ctx, spec->url, observer.get());
    if (!transfer)
    {
        std::cerr << "Error: " << describe(transfer.error()) << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    std::atomic<bool> finished{ false };
    std::thread watcher(
        [&]()
        {
            while (!finished.load())
            {
                if (interrupt_requested)
                {
                    transfer.value()->cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

    auto result = transfer.value()->run(spec.value());
    finished = true;
    watcher.join();

    if (!result)
    {
        std::cerr << "Error: " << describe(result.error()) << std::endl;
        return 1;
    }

    if (opts.quiet || opts.json)
        spdlog::info("Saved {}", result->string());
    else
        std::cout << result->string() << std::endl;
    return 0;
}
