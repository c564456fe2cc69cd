#ifndef SEGLOADER_TRANSPORT_HPP
#define SEGLOADER_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/curl.hpp>
#include <segloader/errors.hpp>

namespace segloader
{
    class Context;

    struct HttpRequest
    {
        std::string url;
        std::vector<std::string> headers;
        std::string proxy;
        std::chrono::seconds connect_timeout = std::chrono::seconds(15);
        std::chrono::seconds read_timeout = std::chrono::seconds(60);
        // "start-end" or "start-" without the "bytes=" prefix. Empty: whole resource.
        std::optional<std::string> range;
        bool head_only = false;
    };

    // Receives the final response head (after redirects) before any body byte.
    // Returning false aborts the request.
    using head_callback_type = std::function<bool(const Response&)>;
    // Receives the body in the order it arrives. Returning false aborts the request.
    using body_callback_type = std::function<bool(const char*, std::size_t)>;

    // Seam between the transfer engine and the network. Implementations must be safe to
    // call from several worker threads at once.
    class SEGLOADER_API Transport
    {
    public:
        virtual ~Transport() = default;

        // Performs `request`; the body is streamed to `on_body` (discarded when empty).
        // Errors are network level failures only: any HTTP status is returned as a
        // Response for the caller to judge. A request aborted by a callback returns an
        // error as well.
        virtual tl::expected<Response, TransferError> perform(const HttpRequest& request,
                                                              const head_callback_type& on_head,
                                                              const body_callback_type& on_body)
            = 0;

        tl::expected<Response, TransferError> head(const HttpRequest& request);
    };

    class SEGLOADER_API CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(const Context& ctx);

        tl::expected<Response, TransferError> perform(const HttpRequest& request,
                                                      const head_callback_type& on_head,
                                                      const body_callback_type& on_body) override;

    private:
        const Context& m_ctx;
    };

    // Maps a libcurl result to an error level: setup and local failures are FATAL,
    // timeouts SERIOUS, everything else INFO (retryable).
    SEGLOADER_API ErrorLevel curl_error_level(CURLcode code) noexcept;
}

#endif
