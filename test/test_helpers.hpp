#ifndef SEGLOADER_TEST_HELPERS_HPP
#define SEGLOADER_TEST_HELPERS_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include <segloader/fileio.hpp>
#include <segloader/transport.hpp>

namespace segloader::testing
{
    // Deterministic, non repeating enough content to catch misplaced segments.
    inline std::string make_content(std::size_t size)
    {
        std::string res(size, '\0');
        for (std::size_t i = 0; i < size; ++i)
        {
            res[i] = static_cast<char>((i * 31 + i / 251) % 256);
        }
        return res;
    }

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    inline void write_file(const fs::path& path, const std::string& content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Fresh directory under the system temp dir, removed with its content.
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            m_path = fs::temp_directory_path() / fmt::format("segloader-test-{:x}", rd());
            fs::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const
        {
            return m_path;
        }

        fs::path operator/(const std::string& name) const
        {
            return m_path / name;
        }

    private:
        fs::path m_path;
    };

    // Serves `content` from memory the way an HTTP server would.
    class FakeTransport : public Transport
    {
    public:
        explicit FakeTransport(std::string content)
            : content(std::move(content))
        {
        }

        std::string content;

        // server behaviour
        bool head_supported = true;
        bool accept_ranges = true;
        // serves ranges but leaves out the Accept-Ranges header
        bool advertise_ranges = true;
        bool send_length = true;
        // answers ranged requests with the whole body and 200
        bool ignore_ranges = false;
        std::string content_disposition;
        std::string effective_url;
        std::size_t buffer_size = 16 * 1024;

        // failure injection
        std::atomic<int> fail_gets{ 0 };
        std::atomic<int> status_gets{ 0 };
        long injected_status = 503;
        // a connection dropped after this many body bytes, once per `drop_gets`
        std::atomic<int> drop_gets{ 0 };
        std::size_t drop_after = 0;

        // called before every body buffer is delivered
        std::function<void(const HttpRequest&, std::size_t)> on_deliver;

        // statistics
        std::atomic<std::size_t> heads{ 0 };
        std::atomic<std::size_t> gets{ 0 };
        std::atomic<std::size_t> bytes_served{ 0 };

        std::vector<std::string> requested_ranges() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_ranges;
        }

        tl::expected<Response, TransferError> perform(const HttpRequest& request,
                                                      const head_callback_type& on_head,
                                                      const body_callback_type& on_body) override
        {
            Response response;
            response.effective_url = effective_url.empty() ? request.url : effective_url;
            if (!content_disposition.empty())
                response.headers["content-disposition"] = content_disposition;
            if (accept_ranges && advertise_ranges)
                response.headers["accept-ranges"] = "bytes";

            if (request.head_only)
            {
                ++heads;
                if (!head_supported)
                {
                    response.http_status = 405;
                    response.headers.erase("accept-ranges");
                    return response;
                }
                response.http_status = 200;
                if (send_length)
                    response.headers["content-length"] = std::to_string(content.size());
                if (on_head && !on_head(response))
                    return aborted();
                return response;
            }

            ++gets;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_ranges.push_back(request.range.value_or(""));
            }

            if (fail_gets.load() > 0 && fail_gets-- > 0)
            {
                return tl::unexpected(TransferError{
                    ErrorLevel::INFO, ErrorCode::SL_CURL, "injected connection failure" });
            }
            if (status_gets.load() > 0 && status_gets-- > 0)
            {
                response.http_status = injected_status;
                if (on_head && !on_head(response))
                    return aborted();
                return response;
            }

            std::size_t begin = 0, end = content.size();
            if (request.range && accept_ranges && !ignore_ranges)
            {
                auto dash = request.range->find('-');
                begin = std::stoull(request.range->substr(0, dash));
                const std::string last = request.range->substr(dash + 1);
                if (!last.empty())
                    end = std::min<std::size_t>(std::stoull(last) + 1, content.size());
                if (begin >= content.size())
                {
                    response.http_status = 416;
                    response.headers["content-range"] = fmt::format("bytes */{}", content.size());
                    if (on_head && !on_head(response))
                        return aborted();
                    return response;
                }
                response.http_status = 206;
                response.headers["content-range"]
                    = fmt::format("bytes {}-{}/{}", begin, end - 1, content.size());
                response.headers["content-length"] = std::to_string(end - begin);
            }
            else
            {
                response.http_status = 200;
                if (send_length)
                    response.headers["content-length"] = std::to_string(content.size());
            }

            if (on_head && !on_head(response))
                return aborted();

            const bool drop = drop_gets.load() > 0 && drop_gets-- > 0;
            std::size_t sent = 0;
            for (std::size_t pos = begin; pos < end; pos += buffer_size)
            {
                std::size_t n = std::min(buffer_size, end - pos);
                if (drop && sent + n > drop_after)
                {
                    n = drop_after - sent;
                }
                if (on_deliver)
                    on_deliver(request, n);
                if (n > 0)
                {
                    bytes_served += n;
                    sent += n;
                    if (on_body && !on_body(content.data() + pos, n))
                        return aborted();
                }
                if (drop && sent >= drop_after)
                {
                    return tl::unexpected(TransferError{
                        ErrorLevel::INFO, ErrorCode::SL_CURL, "injected connection reset" });
                }
            }
            return response;
        }

    private:
        static tl::unexpected<TransferError> aborted()
        {
            return tl::unexpected(
                TransferError{ ErrorLevel::INFO, ErrorCode::SL_CURL, "aborted by callback" });
        }

        mutable std::mutex m_mutex;
        std::vector<std::string> m_ranges;
    };
}

#endif
