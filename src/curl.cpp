#include <atomic>
#include <utility>

#include <spdlog/spdlog.h>

#include <segloader/context.hpp>
#include <segloader/curl.hpp>
#include <segloader/utils.hpp>

#include "curl_internal.hpp"

namespace segloader
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }


    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        m_errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        setopt(CURLOPT_MAXREDIRS, ctx.max_redirects);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        // worker threads must never receive SIGALRM from the resolver
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

            if (ctx.ssl_no_revoke)
            {
                setopt(CURLOPT_SSL_OPTIONS, static_cast<long>(CURLSSLOPT_NO_REVOKE));
            }
        }

        user_agent(ctx.user_agent);

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url, const std::string& proxy)
    {
        setopt(CURLOPT_URL, url);
        if (!proxy.empty())
        {
            setopt(CURLOPT_PROXY, proxy);
        }
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        setopt(CURLOPT_USERAGENT, fmt::format("{} {}", user_agent, curl_version()));
        return *this;
    }

    CURLHandle& CURLHandle::timeouts(long connect_timeout, long read_timeout)
    {
        setopt(CURLOPT_CONNECTTIMEOUT, connect_timeout);
        // A read stalled below `low_speed_limit` for this long aborts the transfer
        setopt(CURLOPT_LOW_SPEED_TIME, read_timeout);
        return *this;
    }

    CURLHandle& CURLHandle::range(const std::string& byte_range)
    {
        setopt(CURLOPT_RANGE, byte_range);
        return *this;
    }

    CURLHandle& CURLHandle::head_only()
    {
        setopt(CURLOPT_NOBODY, 1L);
        return *this;
    }

    CURLHandle& CURLHandle::set_head_callback(head_callback_type func)
    {
        m_head_callback = std::move(func);
        return *this;
    }

    CURLHandle& CURLHandle::set_write_callback(write_callback_type func)
    {
        m_write_callback = std::move(func);
        return *this;
    }

    std::size_t CURLHandle::header_callback(char* buffer,
                                            std::size_t size,
                                            std::size_t nitems,
                                            CURLHandle* self)
    {
        const std::size_t all = size * nitems;
        std::string_view header(buffer, all);

        // Every followed redirect starts over with a new status line
        if (starts_with(header, "HTTP/"))
        {
            self->m_response->headers.clear();
            return all;
        }

        auto kv = parse_header(header);
        if (!kv.first.empty())
        {
            self->m_response->headers[kv.first] = kv.second;
        }
        return all;
    }

    std::size_t CURLHandle::write_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           CURLHandle* self)
    {
        const std::size_t all = size * nitems;
        if (!self->m_head_delivered)
        {
            self->m_head_delivered = true;
            self->m_response->fill_values(*self);
            if (self->m_head_callback && !self->m_head_callback(*self->m_response))
            {
                return 0;
            }
        }

        if (self->m_write_callback && !self->m_write_callback(buffer, all))
        {
            return 0;
        }
        return all;
    }

    void CURLHandle::set_default_callbacks()
    {
        m_response.reset(new Response);
        m_head_delivered = false;

        setopt(CURLOPT_HEADERFUNCTION, &CURLHandle::header_callback);
        setopt(CURLOPT_HEADERDATA, this);
        setopt(CURLOPT_WRITEFUNCTION, &CURLHandle::write_callback);
        setopt(CURLOPT_WRITEDATA, this);
    }

    tl::expected<Response, CURLcode> CURLHandle::try_perform()
    {
        set_default_callbacks();
        CURLcode curl_result = curl_easy_perform(handle());
        if (curl_result != CURLE_OK)
        {
            return tl::unexpected(curl_result);
        }

        m_response->fill_values(*this);
        if (!m_head_delivered)
        {
            // Empty body (HEAD request, zero length resource)
            m_head_delivered = true;
            if (m_head_callback && !m_head_callback(*m_response))
            {
                return tl::unexpected(CURLE_ABORTED_BY_CALLBACK);
            }
        }
        Response response = std::move(*m_response);
        m_response.reset();
        return response;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (res && res.value() != nullptr)
            return std::string(res.value());
        else if (res)
            return std::string();
        else
            return tl::unexpected(res.error());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    /************
     * Response *
     ************/

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        auto it = headers.find(to_lower(header));
        if (it != headers.end())
            return it->second;
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup(const std::optional<ssl_backend_t>& ssl_backend)
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "segloader::CURLSetup created more than once - instance must be unique");
            }

            if (ssl_backend)
            {
                const auto res = curl_global_sslset(
                    static_cast<curl_sslbackend>(ssl_backend.value()), nullptr, nullptr);
                if (res != CURLSSLSET_OK)
                {
                    is_curl_setup_alive = false;
                }
                if (res == CURLSSLSET_UNKNOWN_BACKEND)
                {
                    throw curl_error("unknown curl ssl backend");
                }
                else if (res == CURLSSLSET_NO_BACKENDS)
                {
                    throw curl_error("no curl ssl backend available");
                }
                else if (res == CURLSSLSET_TOO_LATE)
                {
                    throw curl_error("curl ssl backend set too late");
                }
                else if (res != CURLSSLSET_OK)
                {
                    throw curl_error("failed to set curl ssl backend");
                }
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
