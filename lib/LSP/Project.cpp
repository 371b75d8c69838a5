//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements AL project discovery and handshake payload builders.
///
//===----------------------------------------------------------------------===//

#include "alproxy/LSP/Project.h"

#include "alproxy/Support/Paths.h"
#include "llvm/Support/Path.h"

#include <filesystem>
#include <system_error>

namespace alproxy::lsp
{
namespace
{

llvm::json::Object dynamicRegistration()
{
    return llvm::json::Object{{"dynamicRegistration", true}};
}

std::string folderName(const llvm::StringRef path)
{
    return llvm::sys::path::filename(path).str();
}

}  // namespace

std::optional<std::string> findManifest(const llvm::StringRef startDirectory,
                                        const llvm::StringRef manifestName,
                                        const unsigned        maxDepth)
{
    std::filesystem::path directory(startDirectory.str());
    for (unsigned depth = 0; depth < maxDepth; ++depth)
    {
        const std::filesystem::path candidate = directory / manifestName.str();
        std::error_code             ec;
        if (std::filesystem::is_regular_file(candidate, ec))
        {
            return candidate.string();
        }

        const std::filesystem::path parent = directory.parent_path();
        if (parent.empty() || parent == directory)
        {
            break;
        }
        directory = parent;
    }
    return std::nullopt;
}

std::optional<std::string> findProjectRoot(const llvm::StringRef filePath,
                                           const llvm::StringRef manifestName,
                                           const unsigned        maxDepth)
{
    const std::string normalized = normalizePath(filePath);
    const auto        manifest   = findManifest(llvm::sys::path::parent_path(normalized), manifestName, maxDepth);
    if (!manifest)
    {
        return std::nullopt;
    }
    return llvm::sys::path::parent_path(*manifest).str();
}

llvm::StringRef languageIdForPath(const llvm::StringRef path)
{
    return llvm::sys::path::extension(path) == ".json" ? "json" : "al";
}

llvm::json::Object makeWorkspaceSettings(const llvm::StringRef projectRoot)
{
    return llvm::json::Object{
        {"workspacePath", projectRoot.str()},
        {"alResourceConfigurationSettings",
         llvm::json::Object{
             {"assemblyProbingPaths", llvm::json::Array{"./.netpackages"}},
             {"codeAnalyzers", llvm::json::Array{}},
             {"enableCodeAnalysis", false},
             {"backgroundCodeAnalysis", "Project"},
             {"packageCachePaths", llvm::json::Array{"./.alpackages"}},
             {"ruleSetPath", nullptr},
             {"enableCodeActions", true},
             {"incrementalBuild", false},
             {"outputAnalyzerStatistics", true},
             {"enableExternalRulesets", true},
         }},
        {"setActiveWorkspace", true},
        {"dependencyParentWorkspacePath", nullptr},
        {"expectedProjectReferenceDefinitions", llvm::json::Array{}},
        {"activeWorkspaceClosure", llvm::json::Array{projectRoot.str()}},
    };
}

llvm::json::Value makeDidChangeConfigurationParams(const llvm::StringRef projectRoot)
{
    return llvm::json::Object{{"settings", makeWorkspaceSettings(projectRoot)}};
}

llvm::json::Value makeActiveWorkspaceParams(const llvm::StringRef projectRoot)
{
    return llvm::json::Object{
        {"currentWorkspaceFolderPath",
         llvm::json::Object{
             {"uri", pathToFileUri(projectRoot)},
             {"name", folderName(projectRoot)},
             {"index", 0},
         }},
        {"settings", makeWorkspaceSettings(projectRoot)},
    };
}

llvm::json::Value makeDidOpenParams(const llvm::StringRef path, const llvm::StringRef text)
{
    return llvm::json::Object{
        {"textDocument",
         llvm::json::Object{
             {"uri", pathToFileUri(path)},
             {"languageId", languageIdForPath(path).str()},
             {"version", 1},
             {"text", text.str()},
         }},
    };
}

llvm::json::Value makeServerInitializeParams(const llvm::StringRef workspaceRoot, const std::int64_t processId)
{
    llvm::json::Object workspace{
        {"applyEdit", true},
        {"workspaceEdit", llvm::json::Object{{"documentChanges", true}}},
        {"didChangeConfiguration", dynamicRegistration()},
        {"didChangeWatchedFiles", dynamicRegistration()},
        {"symbol", dynamicRegistration()},
        {"executeCommand", dynamicRegistration()},
        {"configuration", true},
        {"workspaceFolders", true},
    };

    llvm::json::Object textDocument{
        {"synchronization",
         llvm::json::Object{
             {"dynamicRegistration", true},
             {"willSave", true},
             {"willSaveWaitUntil", true},
             {"didSave", true},
         }},
        {"completion",
         llvm::json::Object{
             {"dynamicRegistration", true},
             {"completionItem", llvm::json::Object{{"snippetSupport", true}}},
         }},
        {"hover", dynamicRegistration()},
        {"signatureHelp", dynamicRegistration()},
        {"definition", dynamicRegistration()},
        {"references", dynamicRegistration()},
        {"documentHighlight", dynamicRegistration()},
        {"documentSymbol", dynamicRegistration()},
        {"codeAction", dynamicRegistration()},
        {"codeLens", dynamicRegistration()},
        {"formatting", dynamicRegistration()},
        {"rangeFormatting", dynamicRegistration()},
        {"onTypeFormatting", dynamicRegistration()},
        {"rename", dynamicRegistration()},
        {"documentLink", dynamicRegistration()},
        {"publishDiagnostics", llvm::json::Object{{"relatedInformation", true}}},
    };

    llvm::json::Object window{
        {"showMessage",
         llvm::json::Object{{"messageActionItem", llvm::json::Object{{"additionalPropertiesSupport", true}}}}},
        {"workDoneProgress", true},
    };

    const std::string rootUri = pathToFileUri(workspaceRoot);
    return llvm::json::Object{
        {"processId", processId},
        {"rootUri", rootUri},
        {"capabilities",
         llvm::json::Object{
             {"workspace", std::move(workspace)},
             {"textDocument", std::move(textDocument)},
             {"window", std::move(window)},
         }},
        {"trace", "verbose"},
        {"workspaceFolders",
         llvm::json::Array{llvm::json::Object{
             {"uri", rootUri},
             {"name", folderName(workspaceRoot)},
         }}},
    };
}

std::optional<std::string> workspaceRootFromInitialize(const llvm::json::Value* params)
{
    const auto* object = params ? params->getAsObject() : nullptr;
    if (!object)
    {
        return std::nullopt;
    }

    if (const auto rootUri = object->getString("rootUri"))
    {
        if (!rootUri->empty())
        {
            return fileUriToPath(*rootUri);
        }
    }
    if (const auto rootPath = object->getString("rootPath"))
    {
        if (!rootPath->empty())
        {
            return rootPath->str();
        }
    }
    if (const auto* folders = object->getArray("workspaceFolders"))
    {
        if (!folders->empty())
        {
            if (const auto* folder = folders->front().getAsObject())
            {
                if (const auto uri = folder->getString("uri"))
                {
                    return fileUriToPath(*uri);
                }
            }
        }
    }
    return std::nullopt;
}

}  // namespace alproxy::lsp
