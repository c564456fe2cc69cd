#ifndef SEGLOADER_URL_HPP
#define SEGLOADER_URL_HPP

#include <string>

#include <segloader/export.hpp>

extern "C"
{
#include <curl/curl.h>
}

namespace segloader
{
    // Owns a libcurl URL handle. Throws `std::invalid_argument` on a URL curl cannot parse.
    class SEGLOADER_API URLHandler
    {
    public:
        explicit URLHandler(const std::string& url);
        ~URLHandler();

        URLHandler(const URLHandler& rhs);
        URLHandler& operator=(const URLHandler& rhs);
        URLHandler(URLHandler&& rhs) noexcept;
        URLHandler& operator=(URLHandler&& rhs) noexcept;

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        // Path without query, still percent-encoded.
        std::string path() const;

        // Percent-decoded last path segment, empty for "/" or "".
        std::string last_segment() const;

    private:
        std::string get_part(CURLUPart part, unsigned int flags = 0) const;

        CURLU* m_handle = nullptr;
    };

    SEGLOADER_API std::string unescape(const std::string& input);
}

#endif
