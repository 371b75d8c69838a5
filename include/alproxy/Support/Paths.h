//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// File path and `file://` URI helpers.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_PATHS_H
#define ALPROXY_SUPPORT_PATHS_H

#include "llvm/ADT/StringRef.h"

#include <string>

namespace alproxy
{

/// @brief Converts a `file://` URI to a local path.
/// @param[in] uri Document URI. Non-file URIs are returned unchanged.
/// @return Percent-decoded local path.
[[nodiscard]] std::string fileUriToPath(llvm::StringRef uri);

/// @brief Converts a local path to a `file://` URI.
/// @param[in] path Absolute local path.
/// @return URI with every byte outside the unreserved set and `/` percent-encoded.
[[nodiscard]] std::string pathToFileUri(llvm::StringRef path);

/// @brief Returns an absolute, lexically normalized path without a trailing separator.
/// @param[in] path Input path, absolute or relative to the working directory.
/// @return Normalized path, or `path` unchanged when it cannot be made absolute.
[[nodiscard]] std::string normalizePath(llvm::StringRef path);

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_PATHS_H
