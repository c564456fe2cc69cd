#ifndef SEGLOADER_CONTEXT_HPP
#define SEGLOADER_CONTEXT_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <segloader/export.hpp>
#include <segloader/curl.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    // Options provided when starting a segloader context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;
    };

    class SEGLOADER_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        bool ssl_no_revoke = false;
        fs::path ssl_ca_info;

        long max_redirects = 10L;
        long low_speed_limit = 1L;

        // Size of the buffers handed to the write callback, this is also the granularity
        // at which the rate limiter and the state file are updated.
        long transfer_buffersize = 64 * 1024;

        std::size_t retry_backoff_factor = 2;
        std::chrono::steady_clock::duration retry_base_delay = std::chrono::seconds(1);
        std::chrono::steady_clock::duration max_retry_delay = std::chrono::seconds(30);

        // Minimum delay between two "downloading" progress events.
        std::chrono::steady_clock::duration progress_interval = std::chrono::milliseconds(200);

        std::string user_agent = "segloader";

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif
