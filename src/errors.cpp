#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <segloader/enums.hpp>
#include <segloader/errors.hpp>

namespace segloader
{
    const char* to_string(TransferPhase phase) noexcept
    {
        switch (phase)
        {
            case TransferPhase::kINITIALIZING:
                return "initializing";
            case TransferPhase::kDOWNLOADING:
                return "downloading";
            case TransferPhase::kCOMPLETED:
                return "completed";
            case TransferPhase::kERROR:
                return "error";
        }
        return "unknown";
    }

    const char* to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::SL_OK:
                return "ok";
            case ErrorCode::SL_BADCONFIG:
                return "bad configuration";
            case ErrorCode::SL_UNSUPPORTEDSOURCE:
                return "unsupported source";
            case ErrorCode::SL_PROBEFAILED:
                return "probe failed";
            case ErrorCode::SL_CURL:
                return "network error";
            case ErrorCode::SL_BADSTATUS:
                return "bad HTTP status";
            case ErrorCode::SL_IO:
                return "I/O error";
            case ErrorCode::SL_RETRIESEXHAUSTED:
                return "retries exhausted";
            case ErrorCode::SL_INTERRUPTED:
                return "interrupted";
            case ErrorCode::SL_ASSEMBLYFAILED:
                return "assembly failed";
            case ErrorCode::SL_INTEGRITYFAILED:
                return "integrity check failed";
            case ErrorCode::SL_STATE:
                return "state file error";
        }
        return "unknown";
    }

    std::string describe(const TransferError& error)
    {
        std::string summary;
        if (error.code == ErrorCode::SL_INTERRUPTED)
        {
            summary = fmt::format("interrupted, resume supported: {}", error.reason);
        }
        else if (error.code == ErrorCode::SL_INTEGRITYFAILED)
        {
            summary = fmt::format("integrity check failed: {}", error.reason);
        }
        else if (error.is_resumable())
        {
            summary = fmt::format(
                "failed ({}), resume supported: {}", to_string(error.code), error.reason);
        }
        else
        {
            summary = fmt::format("failed ({}): {}", to_string(error.code), error.reason);
        }

        if (!error.remaining.empty())
        {
            summary += fmt::format(" [{} segment(s) incomplete: {}]",
                                   error.remaining.size(),
                                   fmt::join(error.remaining, ", "));
        }
        return summary;
    }
}
