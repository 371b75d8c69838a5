//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements AL extension discovery.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/ServerLocator.h"

#include "alproxy/Support/Error.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

#include <filesystem>
#include <regex>
#include <system_error>
#include <tuple>

namespace alproxy
{
namespace
{

constexpr const char* ServerBinaryName = "Microsoft.Dynamics.Nav.EditorServices.Host";

#if defined(__APPLE__)
constexpr const char* ServerPlatformDirectory = "darwin";
#else
constexpr const char* ServerPlatformDirectory = "linux";
#endif

}  // namespace

bool ExtensionVersion::operator<(const ExtensionVersion& other) const
{
    return std::tie(major, minor, patch) < std::tie(other.major, other.minor, other.patch);
}

std::optional<ExtensionVersion> parseExtensionDirectoryName(const llvm::StringRef directoryName)
{
    static const std::regex kPattern(R"(^ms-dynamics-smb\.al-(\d+)\.(\d+)\.(\d+)$)");

    const std::string name = directoryName.str();
    std::smatch       match;
    if (!std::regex_match(name, match, kPattern))
    {
        return std::nullopt;
    }

    ExtensionVersion version;
    if (llvm::StringRef(match[1].str()).getAsInteger(10, version.major) ||
        llvm::StringRef(match[2].str()).getAsInteger(10, version.minor) ||
        llvm::StringRef(match[3].str()).getAsInteger(10, version.patch))
    {
        return std::nullopt;
    }
    return version;
}

llvm::Expected<std::string> findAlExtension(const llvm::StringRef homeDirectory)
{
    const std::filesystem::path extensionsDir = std::filesystem::path(homeDirectory.str()) / ".vscode" / "extensions";

    std::error_code                 ec;
    std::optional<ExtensionVersion> bestVersion;
    std::filesystem::path           bestPath;
    for (const auto& entry : std::filesystem::directory_iterator(extensionsDir, ec))
    {
        std::error_code typeEc;
        if (!entry.is_directory(typeEc))
        {
            continue;
        }
        const auto version = parseExtensionDirectoryName(entry.path().filename().string());
        if (!version)
        {
            continue;
        }
        if (!bestVersion || *bestVersion < *version)
        {
            bestVersion = version;
            bestPath    = entry.path();
        }
    }
    if (ec)
    {
        return makeProxyError(ErrorKind::Io,
                              "failed to read VS Code extensions directory " + extensionsDir.string() + ": " +
                                  ec.message());
    }
    if (!bestVersion)
    {
        return makeProxyError(ErrorKind::Io, "AL extension not found in " + extensionsDir.string());
    }
    return bestPath.string();
}

std::string serverExecutablePath(const llvm::StringRef extensionDirectory)
{
    llvm::SmallString<256> path(extensionDirectory);
    llvm::sys::path::append(path, "bin", ServerPlatformDirectory, ServerBinaryName);
    return std::string(path.str());
}

llvm::Expected<std::string> locateServerExecutable()
{
    llvm::SmallString<256> home;
    if (!llvm::sys::path::home_directory(home))
    {
        return makeProxyError(ErrorKind::Io, "failed to determine the home directory");
    }
    auto extension = findAlExtension(home);
    if (!extension)
    {
        return extension.takeError();
    }
    return serverExecutablePath(*extension);
}

}  // namespace alproxy
