#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/assembler.hpp>
#include <segloader/fileio.hpp>

namespace segloader
{
    namespace
    {
        TransferError assembly_error(std::string reason)
        {
            return { ErrorLevel::FATAL, ErrorCode::SL_ASSEMBLYFAILED, std::move(reason) };
        }

        // rename, or copy + remove when the rename crosses filesystems
        std::error_code move_file(const fs::path& from, const fs::path& to)
        {
            std::error_code ec;
            fs::rename(from, to, ec);
            if (!ec)
                return ec;

            spdlog::debug("Rename {} -> {} failed ({}), copying instead",
                          from.string(),
                          to.string(),
                          ec.message());
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
            if (ec)
                return ec;
            fs::remove(from, ec);
            return ec;
        }
    }

    tl::expected<void, TransferError> assemble(std::vector<Segment> segments,
                                               const fs::path& destination)
    {
        if (segments.empty())
        {
            return tl::unexpected(assembly_error("Nothing to assemble"));
        }

        if (segments.size() == 1)
        {
            const fs::path& partial = segments.front().partial_path();
            std::error_code ec;
            if (!fs::exists(partial, ec))
            {
                // an empty resource never produced a body
                FileIO touch(partial, FileIO::write_binary, ec);
                if (ec)
                {
                    return tl::unexpected(assembly_error(
                        fmt::format("Could not create {}: {}", partial.string(), ec.message())));
                }
            }

            ec = move_file(partial, destination);
            if (ec)
            {
                return tl::unexpected(assembly_error(fmt::format("Could not move {} to {}: {}",
                                                                 partial.string(),
                                                                 destination.string(),
                                                                 ec.message())));
            }
            return {};
        }

        std::sort(segments.begin(),
                  segments.end(),
                  [](const Segment& a, const Segment& b) { return a.start() < b.start(); });

        fs::path assembling = destination;
        assembling += ASSEMBLYEXT;

        {
            std::error_code ec;
            FileIO out(assembling, FileIO::write_binary, ec);
            if (ec)
            {
                return tl::unexpected(assembly_error(
                    fmt::format("Could not create {}: {}", assembling.string(), ec.message())));
            }

            for (const auto& segment : segments)
            {
                FileIO in(segment.partial_path(), FileIO::read_binary, ec);
                if (!ec)
                {
                    out.append_from(in, ec);
                }
                if (ec)
                {
                    const std::string reason = fmt::format(
                        "Could not append {}: {}", segment.partial_path().string(), ec.message());
                    out.close(ec);
                    fs::remove(assembling, ec);
                    return tl::unexpected(assembly_error(reason));
                }
            }

            out.close(ec);
            if (ec)
            {
                return tl::unexpected(assembly_error(
                    fmt::format("Could not close {}: {}", assembling.string(), ec.message())));
            }
        }

        std::error_code ec;
        fs::rename(assembling, destination, ec);
        if (ec)
        {
            return tl::unexpected(
                assembly_error(fmt::format("Could not rename {} to {}: {}",
                                           assembling.string(),
                                           destination.string(),
                                           ec.message())));
        }

        for (const auto& segment : segments)
        {
            fs::remove(segment.partial_path(), ec);
            if (ec)
            {
                spdlog::warn("Could not remove {}: {}",
                             segment.partial_path().string(),
                             ec.message());
            }
        }
        spdlog::debug("Assembled {} segments into {}", segments.size(), destination.string());
        return {};
    }
}
