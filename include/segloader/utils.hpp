#ifndef SEGLOADER_UTILS_HPP
#define SEGLOADER_UTILS_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>

namespace segloader
{
    SEGLOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    SEGLOADER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    template <class B>
    inline std::string hex_string(const B& buffer, std::size_t size)
    {
        std::ostringstream oss;
        oss << std::hex;
        for (std::size_t i = 0; i < size; ++i)
        {
            oss << std::setw(2) << std::setfill('0')
                << static_cast<int>(static_cast<unsigned char>(buffer[i]));
        }
        return oss.str();
    }

    template <class B>
    inline std::string hex_string(const B& buffer)
    {
        return hex_string(buffer, buffer.size());
    }

    SEGLOADER_API std::string string_transform(const std::string_view& input,
                                               int (*functor)(int));
    SEGLOADER_API std::string to_upper(const std::string_view& input);
    SEGLOADER_API std::string to_lower(const std::string_view& input);
    SEGLOADER_API bool contains(const std::string_view& str, const std::string_view& sub_str);
    SEGLOADER_API std::string_view strip(const std::string_view& input);

    // Splits a raw "Key: value\r\n" header line into its lower-cased key and its value.
    // Lines without a colon yield an empty key.
    SEGLOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    // Checks a user supplied "Name: value" request header.
    SEGLOADER_API bool is_valid_request_header(const std::string_view& header);

    SEGLOADER_API std::string get_env(const char* var);
    SEGLOADER_API std::string get_env(const char* var, const std::string& default_value);

    SEGLOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    SEGLOADER_API
    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split);

    // Parses a size shorthand such as "4MB", "500k" or "1.5G".
    // Grammar: a decimal number followed by an optional unit in {k, m, g, t}, case
    // insensitive, with an optional trailing "b". Units are powers of 1024. An empty
    // string is 0.
    SEGLOADER_API tl::expected<std::uint64_t, TransferError> parse_size(
        const std::string_view& input);

    // "10.00MB", "512.00B"
    SEGLOADER_API std::string human_bytes(std::uint64_t n);

    // Magnet links and .torrent files are handled by a peer-to-peer engine.
    SEGLOADER_API bool is_torrent_like(const std::string_view& source);
}

#endif
