//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include "alproxy/Support/Error.h"
#include "alproxy/Support/ServerLocator.h"

namespace
{

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("alproxy-locator-" + std::to_string(now));
}

bool runExtensionScanTests(const std::filesystem::path& home)
{
    const std::filesystem::path extensions = home / ".vscode" / "extensions";

    auto missing = alproxy::findAlExtension(home.string());
    if (missing)
    {
        std::cerr << "expected missing extensions directory to fail\n";
        return false;
    }
    const alproxy::ErrorSummary missingSummary = alproxy::takeErrorSummary(missing.takeError());
    if (missingSummary.kind != alproxy::ErrorKind::Io)
    {
        std::cerr << "expected I/O error for missing extensions directory\n";
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(extensions / "ms-dynamics-smb.al-9.5.2", ec);
    std::filesystem::create_directories(extensions / "ms-dynamics-smb.al-14.0.1", ec);
    std::filesystem::create_directories(extensions / "ms-dynamics-smb.al-14.0.0", ec);
    std::filesystem::create_directories(extensions / "ms-vscode.cpptools-1.20.0", ec);
    {
        // A file with a matching name is not an extension directory.
        std::ofstream out(extensions / "ms-dynamics-smb.al-99.0.0");
        out << "not a directory";
    }
    if (ec)
    {
        std::cerr << "failed to create extension fixture\n";
        return false;
    }

    auto found = alproxy::findAlExtension(home.string());
    if (!found)
    {
        std::cerr << "expected AL extension: " << llvm::toString(found.takeError()) << "\n";
        return false;
    }
    if (std::filesystem::path(*found).filename() != "ms-dynamics-smb.al-14.0.1")
    {
        std::cerr << "expected newest extension version to win, got " << *found << "\n";
        return false;
    }

    const std::string executable = alproxy::serverExecutablePath(*found);
    const std::filesystem::path executablePath(executable);
    if (executablePath.filename() != "Microsoft.Dynamics.Nav.EditorServices.Host" ||
        executablePath.parent_path().parent_path().filename() != "bin")
    {
        std::cerr << "unexpected server executable path: " << executable << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runServerLocatorTests()
{
    const auto version = alproxy::parseExtensionDirectoryName("ms-dynamics-smb.al-13.1.1234567");
    if (!version || version->major != 13U || version->minor != 1U || version->patch != 1234567U)
    {
        std::cerr << "expected extension version to parse\n";
        return false;
    }
    if (alproxy::parseExtensionDirectoryName("ms-dynamics-smb.al-13.1") ||
        alproxy::parseExtensionDirectoryName("ms-dynamics-smb.al-13.1.0-preview") ||
        alproxy::parseExtensionDirectoryName("other.al-13.1.0"))
    {
        std::cerr << "unexpected extension directory match\n";
        return false;
    }

    const alproxy::ExtensionVersion older{9U, 5U, 2U};
    const alproxy::ExtensionVersion newer{14U, 0U, 0U};
    if (!(older < newer) || newer < older)
    {
        std::cerr << "versions must compare numerically\n";
        return false;
    }

    const std::filesystem::path home = makeUniqueTempDir();
    const bool                  ok   = runExtensionScanTests(home);
    std::error_code             ec;
    std::filesystem::remove_all(home, ec);
    return ok;
}
