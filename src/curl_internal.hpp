#ifndef SEGLOADER_SRC_CURL_INTERNAL_HPP
#define SEGLOADER_SRC_CURL_INTERNAL_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/curl.hpp>

namespace segloader
{
    class Context;

    class SEGLOADER_API CURLHandle
    {
    public:
        // Called with the final response head before the first body byte. Returning
        // false aborts the transfer.
        using head_callback_type = std::function<bool(const Response&)>;
        // Called for every body buffer. Returning false aborts the transfer.
        using write_callback_type = std::function<bool(const char*, std::size_t)>;

        explicit CURLHandle(const Context& ctx);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& url(const std::string& url, const std::string& proxy = {});
        CURLHandle& user_agent(const std::string& user_agent);
        CURLHandle& timeouts(long connect_timeout, long read_timeout);
        CURLHandle& range(const std::string& byte_range);
        CURLHandle& head_only();

        // Without a write callback the body is discarded.
        CURLHandle& set_head_callback(head_callback_type func);
        CURLHandle& set_write_callback(write_callback_type func);

        tl::expected<Response, CURLcode> try_perform();

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();

        const char* errorbuffer() const noexcept
        {
            return m_errorbuffer;
        }

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

    private:
        void init_handle(const Context& ctx);
        void set_default_callbacks();

        static std::size_t header_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           CURLHandle* self);
        static std::size_t write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          CURLHandle* self);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char m_errorbuffer[CURL_ERROR_SIZE];

        std::unique_ptr<Response> m_response;
        bool m_head_delivered = false;
        head_callback_type m_head_callback;
        write_callback_type m_write_callback;
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }
}

namespace segloader::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        explicit CURLSetup(const std::optional<ssl_backend_t>& ssl_backend);
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
