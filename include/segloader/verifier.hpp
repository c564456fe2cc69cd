#ifndef SEGLOADER_VERIFIER_HPP
#define SEGLOADER_VERIFIER_HPP

#include <filesystem>
#include <string>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    SEGLOADER_API std::string sha256(const std::string& str) noexcept;

    // Lower-case hex SHA-256 of the file content, read in 32 KiB blocks.
    SEGLOADER_API tl::expected<std::string, TransferError> sha256sum(const fs::path& path);

    // Whether the file matches `expected` (hex, any case).
    SEGLOADER_API tl::expected<bool, TransferError> verify(const fs::path& path,
                                                           const std::string& expected);
}

#endif
