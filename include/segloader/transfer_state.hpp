#ifndef SEGLOADER_TRANSFER_STATE_HPP
#define SEGLOADER_TRANSFER_STATE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    // Bytes written per segment, persisted as JSON next to the destination so an
    // interrupted transfer can resume:
    //
    //   { "url": "...", "total_size": 10485760, "segments": { "0-4194303": 65536 } }
    //
    // Every save writes a temporary file that is then renamed over the state file, so a
    // crash never leaves a half written state behind.
    class SEGLOADER_API TransferState
    {
    public:
        TransferState(fs::path path, std::string url, std::optional<std::uint64_t> total_size);

        TransferState(const TransferState&) = delete;
        TransferState& operator=(const TransferState&) = delete;

        // ".<filename>.segstate.json" in the directory of `destination`
        static fs::path path_for(const fs::path& destination);

        // Adopts the segments stored on disk. Returns false when there is no state file or
        // when it describes another resource (different url or size); the stored entries
        // are then ignored.
        tl::expected<bool, TransferError> load();

        // Records the bytes written for `range_key` and saves. Thread safe.
        tl::expected<void, TransferError> update(const std::string& range_key,
                                                 std::uint64_t written);

        tl::expected<void, TransferError> save() const;
        tl::expected<void, TransferError> remove();

        std::uint64_t written(const std::string& range_key) const;
        std::uint64_t total_written() const;
        std::map<std::string, std::uint64_t> segments() const;

        const fs::path& path() const noexcept
        {
            return m_path;
        }

        bool exists() const;

    private:
        tl::expected<void, TransferError> save_locked() const;

        fs::path m_path;
        std::string m_url;
        std::optional<std::uint64_t> m_total_size;
        std::map<std::string, std::uint64_t> m_segments;

        mutable std::mutex m_mutex;
    };
}

#endif
