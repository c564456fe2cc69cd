#ifndef SEGLOADER_ASSEMBLER_HPP
#define SEGLOADER_ASSEMBLER_HPP

#include <filesystem>
#include <vector>

#include <tl/expected.hpp>

#include <segloader/export.hpp>
#include <segloader/errors.hpp>
#include <segloader/segment.hpp>

namespace segloader
{
    namespace fs = std::filesystem;

    // Joins the partial files of `segments` into `destination`, in range order whatever
    // order they completed in. A single segment is moved into place. Partial files are
    // deleted only once the destination is complete; on failure they are left untouched.
    SEGLOADER_API tl::expected<void, TransferError> assemble(std::vector<Segment> segments,
                                                             const fs::path& destination);
}

#endif
