#ifndef SEGLOADER_TRANSFER_HPP
#define SEGLOADER_TRANSFER_HPP

#include <filesystem>
#include <memory>
#include <string>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/enums.hpp>
#include <segloader/errors.hpp>
#include <segloader/progress.hpp>
#include <segloader/transfer_spec.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    class Context;

    // A download engine: HTTP segments here, a peer-to-peer engine for torrent sources.
    class SEGLOADER_API Transfer
    {
    public:
        virtual ~Transfer() = default;

        // Returns the path of the completed file.
        virtual tl::expected<fs::path, TransferError> run(const TransferSpec& spec) = 0;

        // Safe to call from any thread while `run` is in progress.
        virtual void cancel() = 0;
        virtual ProgressSnapshot progress() const = 0;
    };

    SEGLOADER_API SourceKind detect_source(const std::string& source);

    // Picks the engine for `source`. Torrent sources are reported as unsupported since
    // this build ships no peer-to-peer engine.
    SEGLOADER_API tl::expected<std::unique_ptr<Transfer>, TransferError> make_transfer(
        const Context& ctx, const std::string& source, ProgressObserver* observer = nullptr);
}

#endif
