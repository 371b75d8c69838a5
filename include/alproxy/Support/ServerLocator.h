//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Discovery of the AL language server shipped with the VS Code extension.
///
//===----------------------------------------------------------------------===//
#ifndef ALPROXY_SUPPORT_SERVER_LOCATOR_H
#define ALPROXY_SUPPORT_SERVER_LOCATOR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <optional>
#include <string>

namespace alproxy
{

/// @brief Numeric version parsed from an extension directory name.
struct ExtensionVersion final
{
    unsigned major{0};
    unsigned minor{0};
    unsigned patch{0};

    [[nodiscard]] bool operator<(const ExtensionVersion& other) const;
};

/// @brief Parses `ms-dynamics-smb.al-<major>.<minor>.<patch>`.
/// @param[in] directoryName Bare directory name.
/// @return Parsed version, or `std::nullopt` for any other name.
[[nodiscard]] std::optional<ExtensionVersion> parseExtensionDirectoryName(llvm::StringRef directoryName);

/// @brief Finds the newest AL extension below `<home>/.vscode/extensions`.
/// @param[in] homeDirectory User home directory.
/// @return Extension directory, or an I/O error when none is installed.
[[nodiscard]] llvm::Expected<std::string> findAlExtension(llvm::StringRef homeDirectory);

/// @brief Returns the language-server binary inside an extension directory.
/// @param[in] extensionDirectory Directory returned by `findAlExtension`.
/// @return `<ext>/bin/<platform>/Microsoft.Dynamics.Nav.EditorServices.Host`.
[[nodiscard]] std::string serverExecutablePath(llvm::StringRef extensionDirectory);

/// @brief Locates the server binary for the current user.
/// @return Executable path, or an I/O error.
[[nodiscard]] llvm::Expected<std::string> locateServerExecutable();

}  // namespace alproxy

#endif  // ALPROXY_SUPPORT_SERVER_LOCATOR_H
