#pragma once
#include "tallow/core/failures.hpp"
#include "tallow/core/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace tallow::transfer::engine {

/**
 * @brief Reduce a peer-supplied file name to a safe final path component
 *
 * Directory parts (either separator) are stripped. Empty names, "." and "..",
 * and names containing NUL fail with InvalidInput.
 */
Result<std::string, TransferFailure> SanitizeFileName(std::string_view name);

/// directory/name, or "stem (n).ext" for the first n that is free.
std::filesystem::path UniqueDestination(const std::filesystem::path& directory, const std::string& name);

}
