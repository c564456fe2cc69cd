#include <fstream>
#include <numeric>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/enums.hpp>
#include <segloader/transfer_state.hpp>

namespace segloader
{
    namespace
    {
        TransferError state_error(std::string reason)
        {
            return { ErrorLevel::SERIOUS, ErrorCode::SL_STATE, std::move(reason) };
        }
    }

    TransferState::TransferState(fs::path path,
                                 std::string url,
                                 std::optional<std::uint64_t> total_size)
        : m_path(std::move(path))
        , m_url(std::move(url))
        , m_total_size(total_size)
    {
    }

    fs::path TransferState::path_for(const fs::path& destination)
    {
        return destination.parent_path()
               / fmt::format(".{}" STATEEXT, destination.filename().string());
    }

    bool TransferState::exists() const
    {
        std::error_code ec;
        return fs::exists(m_path, ec);
    }

    tl::expected<bool, TransferError> TransferState::load()
    {
        if (!exists())
        {
            return false;
        }

        nlohmann::json j;
        try
        {
            std::ifstream in(m_path);
            in >> j;
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::unexpected(
                state_error(fmt::format("Could not parse {}: {}", m_path.string(), e.what())));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        try
        {
            const auto url = j.at("url").get<std::string>();
            std::optional<std::uint64_t> total_size;
            if (!j.at("total_size").is_null())
            {
                total_size = j.at("total_size").get<std::uint64_t>();
            }

            if (url != m_url || total_size != m_total_size)
            {
                spdlog::warn("State file {} describes another resource, discarding it",
                             m_path.string());
                m_segments.clear();
                return false;
            }

            m_segments.clear();
            for (const auto& [key, value] : j.at("segments").items())
            {
                m_segments[key] = value.get<std::uint64_t>();
            }
        }
        catch (const nlohmann::json::exception& e)
        {
            m_segments.clear();
            return tl::unexpected(
                state_error(fmt::format("Invalid state file {}: {}", m_path.string(), e.what())));
        }

        spdlog::debug("Loaded state of {} segment(s) from {}", m_segments.size(), m_path.string());
        return true;
    }

    tl::expected<void, TransferError> TransferState::update(const std::string& range_key,
                                                            std::uint64_t written)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_segments[range_key] = written;
        return save_locked();
    }

    tl::expected<void, TransferError> TransferState::save() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return save_locked();
    }

    tl::expected<void, TransferError> TransferState::save_locked() const
    {
        nlohmann::json j;
        j["url"] = m_url;
        j["total_size"] = m_total_size ? nlohmann::json(m_total_size.value()) : nlohmann::json();
        j["segments"] = nlohmann::json::object();
        for (const auto& [key, value] : m_segments)
        {
            j["segments"][key] = value;
        }

        fs::path tmp = m_path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            out << j.dump();
            out.flush();
            if (!out)
            {
                return tl::unexpected(
                    state_error(fmt::format("Could not write {}", tmp.string())));
            }
        }

        std::error_code ec;
        fs::rename(tmp, m_path, ec);
        if (ec)
        {
            fs::remove(tmp, ec);
            return tl::unexpected(state_error(
                fmt::format("Could not replace {}: {}", m_path.string(), ec.message())));
        }
        return {};
    }

    tl::expected<void, TransferError> TransferState::remove()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec)
        {
            return tl::unexpected(state_error(
                fmt::format("Could not remove {}: {}", m_path.string(), ec.message())));
        }
        m_segments.clear();
        return {};
    }

    std::uint64_t TransferState::written(const std::string& range_key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_segments.find(range_key);
        return it == m_segments.end() ? 0 : it->second;
    }

    std::uint64_t TransferState::total_written() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return std::accumulate(m_segments.begin(),
                               m_segments.end(),
                               std::uint64_t(0),
                               [](std::uint64_t acc, const auto& entry)
                               { return acc + entry.second; });
    }

    std::map<std::string, std::uint64_t> TransferState::segments() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_segments;
    }
}
