//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Version information for the alproxy tools.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_VERSION_H
#define ALPROXY_VERSION_H

namespace alproxy
{

/// @brief Human-readable version reported by `--version` and `initialize` logs.
inline constexpr const char* kVersionString = "0.3.0";

}  // namespace alproxy

#endif  // ALPROXY_VERSION_H
