//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements symbol-name heuristics for AL hover text and file-path queries.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/SymbolMatching.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"

#include <regex>

namespace alproxy::lsp
{
namespace
{

/// Hover patterns in priority order; capture group 1 is the symbol name.
const std::regex& hoverPattern(const std::size_t index)
{
    static const std::regex kPatterns[] = {
        std::regex(R"((?:local\s+)?procedure\s+("[^"]+"|[A-Za-z_][A-Za-z0-9_]*))"),
        std::regex(R"(trigger\s+("[^"]+"|[A-Za-z_][A-Za-z0-9_]*))"),
        std::regex(R"(field\s*\([^)]+\)\s+("[^"]+"|[A-Za-z_][A-Za-z0-9_]*))"),
        std::regex(R"(var\s+("[^"]+"|[A-Za-z_][A-Za-z0-9_]*)\s*:)"),
        std::regex(R"(^[^A-Za-z_"]*("[^"]+"|[A-Za-z_][A-Za-z0-9_]*))"),
    };
    return kPatterns[index];
}

constexpr std::size_t HoverPatternCount = 5U;

std::string markedStringText(const llvm::json::Value& value)
{
    if (const auto text = value.getAsString())
    {
        return text->str();
    }
    if (const auto* object = value.getAsObject())
    {
        if (const auto text = object->getString("value"))
        {
            return text->str();
        }
    }
    return {};
}

bool namesMatch(const llvm::StringRef candidate, const llvm::StringRef wanted)
{
    return candidate.equals_insensitive(wanted) || llvm::StringRef(cleanSymbolName(candidate)).equals_insensitive(wanted);
}

bool hasSuffixInsensitive(const llvm::StringRef text, const llvm::StringRef suffix)
{
    return text.size() >= suffix.size() && text.take_back(suffix.size()).equals_insensitive(suffix);
}

std::optional<llvm::json::Value> findInSymbols(const llvm::json::Array& symbols,
                                               const llvm::StringRef    name,
                                               const llvm::StringRef    documentUri)
{
    for (const llvm::json::Value& entry : symbols)
    {
        const auto* symbol = entry.getAsObject();
        if (!symbol)
        {
            continue;
        }

        const auto symbolName = symbol->getString("name");
        if (symbolName && namesMatch(*symbolName, name))
        {
            if (const auto* location = symbol->get("location"))
            {
                return *location;
            }
            if (const auto* range = symbol->get("selectionRange"))
            {
                return llvm::json::Value(llvm::json::Object{{"uri", documentUri.str()}, {"range", *range}});
            }
            if (const auto* range = symbol->get("range"))
            {
                return llvm::json::Value(llvm::json::Object{{"uri", documentUri.str()}, {"range", *range}});
            }
        }

        if (const auto* children = symbol->getArray("children"))
        {
            if (auto found = findInSymbols(*children, name, documentUri))
            {
                return found;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

bool isEmptyDefinitionResult(const llvm::json::Value& result)
{
    if (result.kind() == llvm::json::Value::Null)
    {
        return true;
    }
    if (const auto* array = result.getAsArray())
    {
        return array->empty();
    }
    return false;
}

std::string hoverContentText(const llvm::json::Value& hover)
{
    const auto* object = hover.getAsObject();
    if (!object)
    {
        return {};
    }
    const auto* contents = object->get("contents");
    if (!contents)
    {
        return {};
    }
    if (const auto* parts = contents->getAsArray())
    {
        std::string joined;
        for (const llvm::json::Value& part : *parts)
        {
            const std::string text = markedStringText(part);
            if (text.empty())
            {
                continue;
            }
            if (!joined.empty())
            {
                joined.push_back('\n');
            }
            joined += text;
        }
        return joined;
    }
    return markedStringText(*contents);
}

std::optional<std::string> extractSymbolFromHoverText(const llvm::StringRef content)
{
    if (content.empty())
    {
        return std::nullopt;
    }

    const std::string text = content.str();
    for (std::size_t i = 0; i < HoverPatternCount; ++i)
    {
        std::smatch match;
        if (!std::regex_search(text, match, hoverPattern(i)))
        {
            continue;
        }
        llvm::StringRef name(text.data() + match.position(1), static_cast<std::size_t>(match.length(1)));
        if (name.size() >= 2U && name.front() == '"' && name.back() == '"')
        {
            name = name.drop_front().drop_back();
        }
        return name.str();
    }
    return std::nullopt;
}

std::string cleanSymbolName(const llvm::StringRef name)
{
    const std::size_t paren = name.find('(');
    if (paren != llvm::StringRef::npos && paren > 0U)
    {
        return name.take_front(paren).trim().str();
    }
    return name.str();
}

std::optional<llvm::json::Value> findSymbolLocation(const llvm::json::Value& symbols,
                                                    const llvm::StringRef    name,
                                                    const llvm::StringRef    documentUri)
{
    const auto* array = symbols.getAsArray();
    if (!array || name.empty())
    {
        return std::nullopt;
    }
    return findInSymbols(*array, name, documentUri);
}

bool looksLikeFilePath(const llvm::StringRef query)
{
    return query.contains('/') || query.contains('\\') || hasSuffixInsensitive(query, ".al") ||
           hasSuffixInsensitive(query, ".dal");
}

std::string extractSymbolFromQuery(const llvm::StringRef query)
{
    llvm::StringRef name = query.trim();

    const std::size_t separator = name.find_last_of("/\\");
    if (separator != llvm::StringRef::npos)
    {
        name = name.drop_front(separator + 1U);
    }

    const std::size_t extension = name.rfind('.');
    if (extension != llvm::StringRef::npos && extension > 0U)
    {
        name = name.take_front(extension);
    }

    const std::size_t lastDot = name.rfind('.');
    if (lastDot != llvm::StringRef::npos)
    {
        name = name.drop_front(lastDot + 1U);
    }

    // AL object files are named `<ObjectType> <ObjectId> <Name>`.
    llvm::SmallVector<llvm::StringRef, 3> parts;
    name.split(parts, ' ', /*MaxSplit=*/2, /*KeepEmpty=*/false);
    if (parts.size() == 3U && llvm::all_of(parts[1], llvm::isDigit))
    {
        name = parts[2].trim();
    }

    name = name.trim();
    return name.empty() ? query.trim().str() : name.str();
}

}  // namespace alproxy::lsp
