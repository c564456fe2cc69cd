#ifndef SEGLOADER_API_HPP
#define SEGLOADER_API_HPP

// Project version
#define SEGLOADER_VERSION_MAJOR 0
#define SEGLOADER_VERSION_MINOR 1
#define SEGLOADER_VERSION_PATCH 0

// Binary version
#define SEGLOADER_BINARY_CURRENT 0
#define SEGLOADER_BINARY_REVISION 0
#define SEGLOADER_BINARY_AGE 0

#include <segloader/context.hpp>
#include <segloader/errors.hpp>
#include <segloader/progress.hpp>
#include <segloader/transfer.hpp>
#include <segloader/transfer_coordinator.hpp>
#include <segloader/transfer_spec.hpp>
#include <segloader/utils.hpp>

#endif
