#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include <segloader/utils.hpp>

namespace segloader
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_upper(const std::string_view& input)
    {
        return string_transform(input, std::toupper);
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::string_view strip(const std::string_view& input)
    {
        std::size_t begin = 0, end = input.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(input[begin])))
            ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])))
            --end;
        return input.substr(begin, end - begin);
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key = header.substr(0, colon_idx);
            // removes leading spaces and the \r\n header ending
            std::string_view value = strip(header.substr(colon_idx + 1));
            // http headers are case insensitive!
            std::string lkey = to_lower(strip(key));

            return std::make_pair(lkey, std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    bool is_valid_request_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx == std::string_view::npos || colon_idx == 0)
            return false;

        // RFC 7230 token characters only in the field name
        std::string_view name = header.substr(0, colon_idx);
        const std::string_view extra = "!#$%&'*+-.^_`|~";
        for (char c : name)
        {
            if (!std::isalnum(static_cast<unsigned char>(c))
                && !contains(extra, std::string_view(&c, 1)))
                return false;
        }
        return !contains(header, "\r") && !contains(header, "\n");
    }

    std::string get_env(const char* var)
    {
        const char* val = getenv(var);
        if (!val)
        {
            throw std::runtime_error(std::string("Could not find env var: ") + var);
        }
        return val;
    }

    std::string get_env(const char* var, const std::string& default_value)
    {
        const char* val = getenv(var);
        if (!val)
        {
            return default_value;
        }
        return val;
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split)
    {
        if (max_split == SIZE_MAX)
            return split(input, sep, max_split);

        std::vector<std::string> result;

        std::ptrdiff_t i, j, len = static_cast<std::ptrdiff_t>(input.size()),
                             n = static_cast<std::ptrdiff_t>(sep.size());
        i = j = len;

        while (i >= n)
        {
            if (input[i - 1] == sep[n - 1] && input.substr(i - n, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(i, j - i));
                i = j = i - n;
            }
            else
            {
                i--;
            }
        }
        result.emplace_back(input.substr(0, j));
        std::reverse(result.begin(), result.end());

        return result;
    }

    tl::expected<std::uint64_t, TransferError> parse_size(const std::string_view& input)
    {
        auto invalid = [&input]()
        {
            return tl::unexpected(TransferError{
                ErrorLevel::FATAL,
                ErrorCode::SL_BADCONFIG,
                fmt::format("invalid size: '{}'", std::string(input)) });
        };

        std::string_view s = strip(input);
        if (s.empty())
            return 0;

        // number part: digits with an optional fraction
        std::size_t pos = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
            ++pos;
        if (pos == 0)
            return invalid();
        if (pos < s.size() && s[pos] == '.')
        {
            const std::size_t fraction_start = ++pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
                ++pos;
            if (pos == fraction_start)
                return invalid();
        }

        const std::string number(s.substr(0, pos));
        const std::string unit = to_lower(strip(s.substr(pos)));

        std::uint64_t multiplier = 1;
        if (unit.empty() || unit == "b")
            multiplier = 1;
        else if (unit == "k" || unit == "kb")
            multiplier = 1024ULL;
        else if (unit == "m" || unit == "mb")
            multiplier = 1024ULL * 1024;
        else if (unit == "g" || unit == "gb")
            multiplier = 1024ULL * 1024 * 1024;
        else if (unit == "t" || unit == "tb")
            multiplier = 1024ULL * 1024 * 1024 * 1024;
        else
            return invalid();

        const long double value = std::strtold(number.c_str(), nullptr);
        const long double bytes = value * static_cast<long double>(multiplier);
        if (!std::isfinite(bytes) || bytes >= 18446744073709551615.0L)
            return invalid();
        return static_cast<std::uint64_t>(bytes);
    }

    std::string human_bytes(std::uint64_t n)
    {
        static constexpr const char* units[] = { "B", "KB", "MB", "GB", "TB" };
        std::size_t i = 0;
        double value = static_cast<double>(n);

        while (value >= 1024 && i < std::size(units) - 1)
        {
            value /= 1024;
            ++i;
        }
        return fmt::format("{:.2f}{}", value, units[i]);
    }

    bool is_torrent_like(const std::string_view& source)
    {
        const std::string lowered = to_lower(source);
        return starts_with(lowered, "magnet:") || ends_with(lowered, ".torrent");
    }
}
