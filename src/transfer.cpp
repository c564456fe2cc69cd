#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <segloader/context.hpp>
#include <segloader/transfer.hpp>
#include <segloader/transfer_coordinator.hpp>
#include <segloader/utils.hpp>

namespace segloader
{
    SourceKind detect_source(const std::string& source)
    {
        return is_torrent_like(source) ? SourceKind::kTORRENT : SourceKind::kHTTP;
    }

    tl::expected<std::unique_ptr<Transfer>, TransferError> make_transfer(
        const Context& ctx, const std::string& source, ProgressObserver* observer)
    {
        switch (detect_source(source))
        {
            case SourceKind::kHTTP:
                return std::make_unique<TransferCoordinator>(
                    ctx, std::make_unique<CurlTransport>(ctx), observer);
            case SourceKind::kTORRENT:
                break;
        }
        return tl::unexpected(TransferError{
            ErrorLevel::FATAL,
            ErrorCode::SL_UNSUPPORTEDSOURCE,
            fmt::format("{} is a torrent source, this build has no peer-to-peer engine", source) });
    }
}
