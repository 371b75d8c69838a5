//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements path and URI conversions.
///
//===----------------------------------------------------------------------===//

#include "alproxy/Support/Paths.h"

#include "llvm/ADT/StringExtras.h"

#include <filesystem>
#include <system_error>

namespace alproxy
{
namespace
{

bool isUnreservedUriByte(const unsigned char ch)
{
    return llvm::isAlnum(static_cast<char>(ch)) || ch == '-' || ch == '.' || ch == '_' || ch == '~' || ch == '/';
}

std::string percentDecode(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '%' && i + 2 < text.size() && llvm::isHexDigit(text[i + 1]) && llvm::isHexDigit(text[i + 2]))
        {
            out.push_back(static_cast<char>((llvm::hexDigitValue(text[i + 1]) << 4U) | llvm::hexDigitValue(text[i + 2])));
            i += 2;
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

}  // namespace

std::string fileUriToPath(llvm::StringRef uri)
{
    if (!uri.consume_front("file://"))
    {
        return uri.str();
    }

    // Skip an authority component such as `localhost`.
    if (!uri.empty() && uri.front() != '/')
    {
        const std::size_t slash = uri.find('/');
        uri                     = slash == llvm::StringRef::npos ? llvm::StringRef() : uri.drop_front(slash);
    }
    return percentDecode(uri);
}

std::string pathToFileUri(const llvm::StringRef path)
{
    std::string uri = "file://";
    if (path.empty() || path.front() != '/')
    {
        uri.push_back('/');
    }
    for (const char ch : path)
    {
        const auto byte = static_cast<unsigned char>(ch);
        if (isUnreservedUriByte(byte))
        {
            uri.push_back(ch);
            continue;
        }
        uri.push_back('%');
        uri.push_back(llvm::hexdigit(byte >> 4U, false));
        uri.push_back(llvm::hexdigit(byte & 0x0FU, false));
    }
    return uri;
}

std::string normalizePath(const llvm::StringRef path)
{
    std::error_code             ec;
    const std::filesystem::path absolute = std::filesystem::absolute(std::filesystem::path(path.str()), ec);
    if (ec)
    {
        return path.str();
    }

    std::filesystem::path normalized = absolute.lexically_normal();
    if (normalized.has_relative_path() && !normalized.has_filename())
    {
        normalized = normalized.parent_path();
    }
    return normalized.string();
}

}  // namespace alproxy
