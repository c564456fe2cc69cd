#include <memory>
#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include <segloader/url.hpp>
#include <segloader/utils.hpp>

namespace segloader
{
    URLHandler::URLHandler(const std::string& url)
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }

        const CURLUcode rc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0);
        if (rc != CURLUE_OK)
        {
            curl_url_cleanup(m_handle);
            m_handle = nullptr;
            throw std::invalid_argument(fmt::format("Could not parse URL '{}' (code {})",
                                                    url,
                                                    static_cast<int>(rc)));
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(rhs.m_handle ? curl_url_dup(rhs.m_handle) : nullptr)
    {
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(m_handle, tmp.m_handle);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs) noexcept
        : m_handle(std::exchange(rhs.m_handle, nullptr))
    {
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs) noexcept
    {
        std::swap(m_handle, rhs.m_handle);
        return *this;
    }

    std::string URLHandler::get_part(CURLUPart part, unsigned int flags) const
    {
        char* value = nullptr;
        if (!m_handle || curl_url_get(m_handle, part, &value, flags) != CURLUE_OK)
        {
            return {};
        }
        std::string res(value);
        curl_free(value);
        return res;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    std::string URLHandler::last_segment() const
    {
        const std::string p = path();
        if (p.empty() || ends_with(p, "/"))
        {
            return {};
        }
        return unescape(rsplit(p, "/", 1).back());
    }

    std::string unescape(const std::string& input)
    {
        int length = 0;
        char* decoded
            = curl_easy_unescape(nullptr, input.c_str(), static_cast<int>(input.size()), &length);
        if (decoded == nullptr)
        {
            return input;
        }
        std::string res(decoded, static_cast<std::size_t>(length));
        curl_free(decoded);
        return res;
    }
}
