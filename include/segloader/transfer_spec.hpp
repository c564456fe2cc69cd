#ifndef SEGLOADER_TRANSFER_SPEC_HPP
#define SEGLOADER_TRANSFER_SPEC_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/transport.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    // Everything the caller decides about one transfer. Not modified once `run` starts.
    struct SEGLOADER_API TransferSpec
    {
        std::string url;
        // Output file, or an existing directory the resolved filename is joined to.
        fs::path destination;
        // Explicit output name, takes precedence over what the server suggests.
        std::string filename;

        std::size_t concurrency = 8;
        std::uint64_t chunk_size = 4 * 1024 * 1024;
        // bytes per second over all workers, 0 is unlimited
        std::uint64_t rate_limit = 0;

        // "Name: value"
        std::vector<std::string> headers;
        std::string proxy;
        std::chrono::seconds connect_timeout = std::chrono::seconds(15);
        std::chrono::seconds read_timeout = std::chrono::seconds(60);

        // Additional attempts after the first one, per segment.
        std::size_t retries = 5;

        std::optional<std::string> expected_sha256;

        // Configuration errors are reported here, before any request is made.
        tl::expected<void, TransferError> validate() const;

        // A request to `target_url` carrying the headers, proxy and timeouts of this spec.
        HttpRequest request(const std::string& target_url) const;
    };
}

#endif
