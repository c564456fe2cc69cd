#ifndef SEGLOADER_CURL_HPP
#define SEGLOADER_CURL_HPP

#include <map>
#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <segloader/export.hpp>

namespace segloader
{
    class CURLHandle;

    enum class ssl_backend_t
    {
        none = CURLSSLBACKEND_NONE,
        openssl = CURLSSLBACKEND_OPENSSL,
        gnutls = CURLSSLBACKEND_GNUTLS,
        wolfssl = CURLSSLBACKEND_WOLFSSL,
        schannel = CURLSSLBACKEND_SCHANNEL,
        securetransport = CURLSSLBACKEND_SECURETRANSPORT,
        mbedtls = CURLSSLBACKEND_MBEDTLS,
        bearssl = CURLSSLBACKEND_BEARSSL,
        rustls = CURLSSLBACKEND_RUSTLS,
    };

    // Status line and headers of one HTTP exchange. Header names are stored lower-cased;
    // when redirects are followed only the headers of the last response are kept.
    struct SEGLOADER_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);
    };

}

#endif
