#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/context.hpp>
#include <segloader/transport.hpp>

#include "curl_internal.hpp"

namespace segloader
{
    tl::expected<Response, TransferError> Transport::head(const HttpRequest& request)
    {
        HttpRequest head_request = request;
        head_request.head_only = true;
        return perform(head_request, {}, {});
    }

    ErrorLevel curl_error_level(CURLcode code) noexcept
    {
        switch (code)
        {
            case CURLE_BAD_FUNCTION_ARGUMENT:
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_NOT_BUILT_IN:
            case CURLE_OUT_OF_MEMORY:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_SSL_CRL_BADFILE:
            case CURLE_FILESIZE_EXCEEDED:
                return ErrorLevel::FATAL;
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_COULDNT_CONNECT:
                return ErrorLevel::SERIOUS;
            default:
                // Other errors are not considered fatal
                return ErrorLevel::INFO;
        }
    }

    CurlTransport::CurlTransport(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    tl::expected<Response, TransferError> CurlTransport::perform(const HttpRequest& request,
                                                                 const head_callback_type& on_head,
                                                                 const body_callback_type& on_body)
    {
        // setup failures of the handle are reported like any other curl error
        try
        {
            CURLHandle h(m_ctx);
            h.url(request.url, request.proxy)
                .timeouts(static_cast<long>(request.connect_timeout.count()),
                          static_cast<long>(request.read_timeout.count()))
                .add_headers(request.headers);

            if (request.head_only)
            {
                h.head_only();
            }
            if (request.range)
            {
                h.range(request.range.value());
            }
            if (on_head)
            {
                h.set_head_callback(on_head);
            }
            // Without a body sink the content is discarded rather than buffered
            h.set_write_callback(on_body ? on_body
                                         : body_callback_type([](const char*, std::size_t)
                                                              { return true; }));

            auto result = h.try_perform();
            if (!result)
            {
                const CURLcode code = result.error();
                std::string reason = fmt::format("CURL error ({}): {} for {} [{}]",
                                                 static_cast<int>(code),
                                                 curl_easy_strerror(code),
                                                 request.url,
                                                 h.errorbuffer());
                spdlog::debug(reason);
                return tl::unexpected(
                    TransferError{ curl_error_level(code), ErrorCode::SL_CURL, std::move(reason) });
            }

            spdlog::debug("{} {} -> {}",
                          request.head_only ? "HEAD" : "GET",
                          request.url,
                          result.value().http_status);
            return std::move(result.value());
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(TransferError{ ErrorLevel::FATAL, ErrorCode::SL_CURL, e.what() });
        }
    }
}
