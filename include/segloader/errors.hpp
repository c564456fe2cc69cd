#ifndef SEGLOADER_ERRORS_HPP
#define SEGLOADER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <segloader/export.hpp>
#include <segloader/enums.hpp>

namespace segloader
{
    struct TransferError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;

        // Range keys of the segments that did not complete, used to report what a resume
        // still has to fetch.
        std::vector<std::string> remaining = {};

        // INFO and SERIOUS errors are worth another attempt, FATAL ones are not.
        bool is_retryable() const noexcept
        {
            return level != ErrorLevel::FATAL;
        }

        bool is_serious() const noexcept
        {
            return (level == ErrorLevel::SERIOUS || level == ErrorLevel::FATAL);
        }

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        bool is_resumable() const noexcept
        {
            return code == ErrorCode::SL_INTERRUPTED || code == ErrorCode::SL_RETRIESEXHAUSTED
                   || code == ErrorCode::SL_ASSEMBLYFAILED;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(reason);
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(reason);
                    break;
                default:
                    spdlog::warn(reason);
            }
        }
    };

    // User facing one-line summary, e.g. "interrupted, resume supported: ...".
    SEGLOADER_API std::string describe(const TransferError& error);

    class SEGLOADER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "curl error");
    };
}

#endif
