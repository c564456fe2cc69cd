#ifndef SEGLOADER_TRANSFER_COORDINATOR_HPP
#define SEGLOADER_TRANSFER_COORDINATOR_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/progress.hpp>
#include <segloader/segment.hpp>
#include <segloader/transfer.hpp>
#include <segloader/transfer_spec.hpp>
#include <segloader/transfer_state.hpp>
#include <segloader/transport.hpp>

namespace segloader
{
    class Context;
    class SegmentWorker;

    // Probes, plans, runs the worker pool and assembles the result of one HTTP transfer.
    class SEGLOADER_API TransferCoordinator : public Transfer
    {
    public:
        TransferCoordinator(const Context& ctx,
                            Transport& transport,
                            ProgressObserver* observer = nullptr);
        TransferCoordinator(const Context& ctx,
                            std::unique_ptr<Transport> transport,
                            ProgressObserver* observer = nullptr);

        tl::expected<fs::path, TransferError> run(const TransferSpec& spec) override;

        // A cancel requested before `run` makes the next run return right away; the
        // request is consumed when that run ends.
        void cancel() override;
        ProgressSnapshot progress() const override;

    private:
        tl::expected<fs::path, TransferError> execute(const TransferSpec& spec);

        // The existing destination is kept when it already holds the resource.
        tl::expected<bool, TransferError> already_complete(const TransferSpec& spec,
                                                           const ProbeResult& probe,
                                                           const fs::path& destination,
                                                           const fs::path& state_path);

        std::optional<TransferError> download(const TransferSpec& spec,
                                              SegmentWorker& worker,
                                              std::vector<Segment>& segments);

        TransferError fail(TransferError error);

        const Context& m_ctx;
        std::unique_ptr<Transport> m_owned_transport;
        Transport& m_transport;
        ProgressTracker m_progress;
        std::atomic<bool> m_stop{ false };
    };

    // A directory destination gets `filename` appended.
    SEGLOADER_API fs::path resolve_destination(const fs::path& destination,
                                               const std::string& filename);
}

#endif
