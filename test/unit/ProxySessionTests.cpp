//===----------------------------------------------------------------------===//
//
// Part of the alproxy project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "alproxy/LSP/JsonRpcIO.h"
#include "alproxy/LSP/Message.h"
#include "alproxy/LSP/ProxySession.h"
#include "alproxy/Support/FdStream.h"
#include "alproxy/Support/Log.h"
#include "alproxy/Support/Paths.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// One OS pipe exposed as a pair of streams.
struct StreamPipe final
{
    std::unique_ptr<alproxy::FdInputStream>  reader;
    std::unique_ptr<alproxy::FdOutputStream> writer;

    bool open()
    {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
        {
            return false;
        }
        reader = std::make_unique<alproxy::FdInputStream>(fds[0], true);
        writer = std::make_unique<alproxy::FdOutputStream>(fds[1], true);
        return true;
    }
};

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("alproxy-session-" + std::to_string(now));
}

/// Scripted AL language server speaking JSON-RPC over the proxy's pipes.
class FakeAlServer final
{
public:
    FakeAlServer(std::istream& in, alproxy::FdOutputStream& out, const bool projectLoads)
        : out_(out)
        , transport_(in, out)
        , projectLoads_(projectLoads)
    {
    }

    void run()
    {
        while (true)
        {
            llvm::json::Value message(nullptr);
            std::string       error;
            if (transport_.readMessage(message, error) != alproxy::lsp::ReadStatus::Message)
            {
                break;
            }
            const auto* object = message.getAsObject();
            if (!object || !object->getString("method"))
            {
                continue;
            }
            const llvm::StringRef method = *object->getString("method");
            const llvm::json::Value* params = object->get("params");
            record(method.str(), params ? *params : llvm::json::Value(nullptr));

            if (const auto* id = alproxy::lsp::messageId(*object))
            {
                (void) transport_.writeMessage(alproxy::lsp::makeResultResponse(*id, resultFor(method, params)));
            }
            else if (method == "exit")
            {
                break;
            }
        }
        out_.close();
    }

    std::vector<std::pair<std::string, llvm::json::Value>> received() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    std::size_t count(const std::string& method) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t                 total = 0;
        for (const auto& [name, _] : received_)
        {
            if (name == method)
            {
                ++total;
            }
        }
        return total;
    }

    static llvm::json::Value customerSymbols()
    {
        return llvm::json::Array{llvm::json::Object{
            {"name", "Customer"},
            {"kind", 5},
            {"location",
             llvm::json::Object{
                 {"uri", "file:///proj/src/Customer.Table.al"},
                 {"range",
                  llvm::json::Object{
                      {"start", llvm::json::Object{{"line", 0}, {"character", 0}}},
                      {"end", llvm::json::Object{{"line", 0}, {"character", 8}}},
                  }},
             }},
        }};
    }

private:
    void record(std::string method, llvm::json::Value params)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.emplace_back(std::move(method), std::move(params));
    }

    llvm::json::Value resultFor(const llvm::StringRef method, const llvm::json::Value* params) const
    {
        if (method == "initialize")
        {
            return llvm::json::Object{
                {"capabilities", llvm::json::Object{{"hoverProvider", true}, {"definitionProvider", true}}},
                {"serverInfo", llvm::json::Object{{"name", "AL Language Server"}}},
            };
        }
        if (method == "al/hasProjectClosureLoadedRequest")
        {
            return projectLoads_;
        }
        if (method == "workspace/symbol")
        {
            const auto* object = params ? params->getAsObject() : nullptr;
            if (object && object->getString("query") == llvm::StringRef("Customer"))
            {
                return customerSymbols();
            }
            return llvm::json::Array{};
        }
        if (method == "al/symbolSearch")
        {
            return llvm::json::Array{};
        }
        return nullptr;
    }

    alproxy::FdOutputStream&                               out_;
    alproxy::lsp::JsonRpcStreamTransport                   transport_;
    bool                                                   projectLoads_;
    mutable std::mutex                                     mutex_;
    std::vector<std::pair<std::string, llvm::json::Value>> received_;
};

/// Reads proxy-to-client traffic on a background thread.
class ClientInbox final
{
public:
    explicit ClientInbox(alproxy::lsp::JsonRpcStreamTransport& transport)
        : transport_(transport)
    {
    }

    void run()
    {
        while (true)
        {
            llvm::json::Value message(nullptr);
            std::string       error;
            if (transport_.readMessage(message, error) != alproxy::lsp::ReadStatus::Message)
            {
                break;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(std::move(message));
            }
            cv_.notify_all();
        }
    }

    std::optional<llvm::json::Object> waitForResponse(const std::int64_t id)
    {
        std::unique_lock<std::mutex>      lock(mutex_);
        std::optional<llvm::json::Object> found;
        cv_.wait_for(lock, std::chrono::seconds(5), [this, id, &found]() {
            for (const llvm::json::Value& message : messages_)
            {
                const auto* object = message.getAsObject();
                if (!object || object->get("method"))
                {
                    continue;
                }
                const auto responseId = object->getInteger("id");
                if (responseId && *responseId == id)
                {
                    found = *object;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

private:
    alproxy::lsp::JsonRpcStreamTransport& transport_;
    std::mutex                            mutex_;
    std::condition_variable               cv_;
    std::vector<llvm::json::Value>        messages_;
};

std::int64_t errorCodeOf(const llvm::json::Object& response)
{
    if (const auto* error = response.getObject("error"))
    {
        if (const auto code = error->getInteger("code"))
        {
            return *code;
        }
    }
    return 0;
}

/// Pipes, fake server, and session wired together for one scenario.
class SessionHarness final
{
public:
    bool start(alproxy::lsp::ProxyConfig config, const bool projectLoads = true)
    {
        if (!clientToProxy_.open() || !proxyToClient_.open() || !proxyToServer_.open() || !serverToProxy_.open())
        {
            std::cerr << "failed to create session pipes\n";
            return false;
        }

        proxyClient_ = std::make_unique<alproxy::lsp::JsonRpcStreamTransport>(*clientToProxy_.reader,
                                                                              *proxyToClient_.writer);
        proxyServer_ = std::make_unique<alproxy::lsp::JsonRpcStreamTransport>(*serverToProxy_.reader,
                                                                              *proxyToServer_.writer);
        client_      = std::make_unique<alproxy::lsp::JsonRpcStreamTransport>(*proxyToClient_.reader,
                                                                         *clientToProxy_.writer);
        server_      = std::make_unique<FakeAlServer>(*proxyToServer_.reader, *serverToProxy_.writer, projectLoads);
        inbox_       = std::make_unique<ClientInbox>(*client_);

        session_ = std::make_unique<alproxy::lsp::ProxySession>(*proxyClient_,
                                                                *proxyServer_,
                                                                std::move(config),
                                                                logger_,
                                                                [this]() { proxyToServer_.writer->close(); },
                                                                [this]() { clientToProxy_.reader->interrupt(); });

        serverThread_  = std::thread([this]() { server_->run(); });
        inboxThread_   = std::thread([this]() { inbox_->run(); });
        sessionThread_ = std::thread([this]() { exitCode_ = session_->run(); });
        return true;
    }

    bool send(const llvm::json::Value& message)
    {
        return client_->writeMessage(message);
    }

    /// Ends the client stream (unless `exit` already ended the session) and
    /// joins every thread.
    int finish(const bool closeClient)
    {
        if (closeClient)
        {
            clientToProxy_.writer->close();
        }
        if (sessionThread_.joinable())
        {
            sessionThread_.join();
        }
        if (serverThread_.joinable())
        {
            serverThread_.join();
        }
        proxyToClient_.writer->close();
        if (inboxThread_.joinable())
        {
            inboxThread_.join();
        }
        return exitCode_;
    }

    ClientInbox& inbox()
    {
        return *inbox_;
    }

    FakeAlServer& server()
    {
        return *server_;
    }

    alproxy::lsp::ProxySession& session()
    {
        return *session_;
    }

private:
    alproxy::Logger logger_{llvm::nulls(), alproxy::TraceLevel::Verbose};

    StreamPipe clientToProxy_;
    StreamPipe proxyToClient_;
    StreamPipe proxyToServer_;
    StreamPipe serverToProxy_;

    std::unique_ptr<alproxy::lsp::JsonRpcStreamTransport> proxyClient_;
    std::unique_ptr<alproxy::lsp::JsonRpcStreamTransport> proxyServer_;
    std::unique_ptr<alproxy::lsp::JsonRpcStreamTransport> client_;
    std::unique_ptr<FakeAlServer>                         server_;
    std::unique_ptr<ClientInbox>                          inbox_;
    std::unique_ptr<alproxy::lsp::ProxySession>           session_;

    std::thread serverThread_;
    std::thread inboxThread_;
    std::thread sessionThread_;
    int         exitCode_{-1};
};

alproxy::lsp::ProxyConfig testConfig()
{
    alproxy::lsp::ProxyConfig config;
    config.requestTimeout           = std::chrono::milliseconds(3000);
    config.projectLoad.pollInterval = std::chrono::milliseconds(10);
    config.projectLoad.maxAttempts  = 3U;
    config.workerCount              = 2U;
    return config;
}

llvm::json::Value request(const std::int64_t id, const std::string& method, llvm::json::Value params)
{
    return llvm::json::Object{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

bool runLifecycleScenario(SessionHarness& harness, const std::string& projectRoot)
{
    const std::string rootUri = alproxy::pathToFileUri(projectRoot);
    if (!harness.send(request(1,
                              "initialize",
                              llvm::json::Object{{"processId", 1}, {"rootUri", rootUri}, {"capabilities", llvm::json::Object{}}})))
    {
        std::cerr << "failed to send initialize\n";
        return false;
    }
    const auto initialized = harness.inbox().waitForResponse(1);
    const auto* result       = initialized ? initialized->getObject("result") : nullptr;
    const auto* capabilities = result ? result->getObject("capabilities") : nullptr;
    if (!capabilities || capabilities->getBoolean("hoverProvider") != true)
    {
        std::cerr << "expected server capabilities relayed under id 1\n";
        return false;
    }
    if (harness.session().state() != alproxy::lsp::SessionState::Ready ||
        harness.session().projectRoot() != projectRoot)
    {
        std::cerr << "expected ready session with detected project root\n";
        return false;
    }

    const auto serverInitialize = harness.server().received();
    const auto* initParams = serverInitialize.empty() ? nullptr : serverInitialize.front().second.getAsObject();
    if (!initParams || serverInitialize.front().first != "initialize" ||
        initParams->getString("rootUri") != llvm::StringRef(rootUri) || !initParams->getInteger("processId"))
    {
        std::cerr << "server must receive the proxy's initialize for the project root\n";
        return false;
    }

    (void) harness.send(llvm::json::Object{{"jsonrpc", "2.0"}, {"method", "initialized"}, {"params", llvm::json::Object{}}});

    (void) harness.send(request(2, "workspace/symbol", llvm::json::Object{{"query", "Customer"}}));
    const auto symbols = harness.inbox().waitForResponse(2);
    const auto* found  = symbols ? symbols->get("result") : nullptr;
    if (!found || *found != FakeAlServer::customerSymbols())
    {
        std::cerr << "expected workspace/symbol result relayed unchanged\n";
        return false;
    }

    std::vector<std::string> sequence;
    for (const auto& [method, _] : harness.server().received())
    {
        sequence.push_back(method);
    }
    const std::vector<std::string> expectedSequence{
        "initialize",
        "initialized",
        "workspace/didChangeConfiguration",
        "textDocument/didOpen",
        "al/setActiveWorkspace",
        "al/hasProjectClosureLoadedRequest",
        "workspace/symbol",
    };
    if (sequence != expectedSequence)
    {
        std::cerr << "unexpected server traffic before workspace/symbol:";
        for (const std::string& method : sequence)
        {
            std::cerr << " " << method;
        }
        std::cerr << "\n";
        return false;
    }

    (void) harness.send(request(3, "workspace/symbol", llvm::json::Object{{"query", ""}}));
    const auto empty = harness.inbox().waitForResponse(3);
    if (!empty || errorCodeOf(*empty) != alproxy::lsp::JsonRpcErrorInvalidParams)
    {
        std::cerr << "expected InvalidParams for an empty workspace/symbol query\n";
        return false;
    }

    (void) harness.send(request(4,
                                "textDocument/prepareCallHierarchy",
                                llvm::json::Object{
                                    {"textDocument", llvm::json::Object{{"uri", rootUri + "/src/Customer.Table.al"}}},
                                    {"position", llvm::json::Object{{"line", 1}, {"character", 1}}},
                                }));
    const auto unsupported = harness.inbox().waitForResponse(4);
    if (!unsupported || errorCodeOf(*unsupported) != alproxy::lsp::JsonRpcErrorMethodNotFound)
    {
        std::cerr << "expected MethodNotFound for prepareCallHierarchy\n";
        return false;
    }
    if (harness.server().count("workspace/symbol") != 1U ||
        harness.server().count("textDocument/prepareCallHierarchy") != 0U ||
        harness.server().count("textDocument/didOpen") != 1U)
    {
        std::cerr << "locally answered requests must not reach the server\n";
        return false;
    }

    (void) harness.send(request(5, "shutdown", nullptr));
    const auto shutdown = harness.inbox().waitForResponse(5);
    const auto* shutdownResult = shutdown ? shutdown->get("result") : nullptr;
    if (!shutdownResult || shutdownResult->kind() != llvm::json::Value::Null)
    {
        std::cerr << "expected null shutdown result\n";
        return false;
    }

    (void) harness.send(request(6, "textDocument/hover", llvm::json::Object{}));
    const auto late = harness.inbox().waitForResponse(6);
    if (!late || errorCodeOf(*late) != alproxy::lsp::JsonRpcErrorInvalidRequest)
    {
        std::cerr << "requests after shutdown must be rejected\n";
        return false;
    }

    (void) harness.send(llvm::json::Object{{"jsonrpc", "2.0"}, {"method", "exit"}});
    return true;
}

bool runUnconfirmedProjectLoadScenario(SessionHarness& harness, const std::string& projectRoot, const unsigned attempts)
{
    (void) harness.send(request(1,
                                "initialize",
                                llvm::json::Object{{"processId", 1},
                                                   {"rootUri", alproxy::pathToFileUri(projectRoot)},
                                                   {"capabilities", llvm::json::Object{}}}));
    if (!harness.inbox().waitForResponse(1))
    {
        std::cerr << "expected initialize response\n";
        return false;
    }

    (void) harness.send(request(2, "workspace/symbol", llvm::json::Object{{"query", "Customer"}}));
    const auto symbols = harness.inbox().waitForResponse(2);
    const auto* found  = symbols ? symbols->get("result") : nullptr;
    if (!found || *found != FakeAlServer::customerSymbols())
    {
        std::cerr << "workspace/symbol must still be answered when the project never reports loaded\n";
        return false;
    }

    if (harness.server().count("al/hasProjectClosureLoadedRequest") != attempts)
    {
        std::cerr << "expected " << attempts << " project load polls, got "
                  << harness.server().count("al/hasProjectClosureLoadedRequest") << "\n";
        return false;
    }
    const auto received = harness.server().received();
    if (received.empty() || received.back().first != "workspace/symbol")
    {
        std::cerr << "workspace/symbol must be forwarded after polling gives up\n";
        return false;
    }
    if (!harness.session().workspace().isProjectInitialized(projectRoot))
    {
        std::cerr << "project root must be marked initialized after polling gives up\n";
        return false;
    }

    (void) harness.send(request(3, "workspace/symbol", llvm::json::Object{{"query", "Customer"}}));
    if (!harness.inbox().waitForResponse(3) || harness.server().count("al/hasProjectClosureLoadedRequest") != attempts ||
        harness.server().count("workspace/didChangeConfiguration") != 1U)
    {
        std::cerr << "an initialized project must not be set up again\n";
        return false;
    }

    (void) harness.send(request(4, "shutdown", nullptr));
    (void) harness.inbox().waitForResponse(4);
    (void) harness.send(llvm::json::Object{{"jsonrpc", "2.0"}, {"method", "exit"}});
    return true;
}

/// The language server's stream ends while the client stays connected.
bool runServerClosesFirstScenario()
{
    StreamPipe clientToProxy;
    StreamPipe proxyToClient;
    StreamPipe proxyToServer;
    StreamPipe serverToProxy;
    if (!clientToProxy.open() || !proxyToClient.open() || !proxyToServer.open() || !serverToProxy.open())
    {
        std::cerr << "failed to create session pipes\n";
        return false;
    }
    serverToProxy.writer->close();

    alproxy::Logger                      logger(llvm::nulls(), alproxy::TraceLevel::Verbose);
    alproxy::lsp::JsonRpcStreamTransport proxyClient(*clientToProxy.reader, *proxyToClient.writer);
    alproxy::lsp::JsonRpcStreamTransport proxyServer(*serverToProxy.reader, *proxyToServer.writer);
    alproxy::lsp::JsonRpcStreamTransport client(*proxyToClient.reader, *clientToProxy.writer);

    auto session = std::make_unique<alproxy::lsp::ProxySession>(
        proxyClient,
        proxyServer,
        testConfig(),
        logger,
        [&proxyToServer]() { proxyToServer.writer->close(); },
        [&clientToProxy]() { clientToProxy.reader->interrupt(); });

    std::mutex              mutex;
    std::condition_variable cv;
    bool                    returned = false;
    int                     exitCode = -1;
    std::thread             runner([&]() {
        const int code = session->run();
        {
            std::lock_guard<std::mutex> lock(mutex);
            exitCode = code;
            returned = true;
        }
        cv.notify_all();
    });

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        finished = cv.wait_for(lock, std::chrono::seconds(5), [&returned]() { return returned; });
    }
    if (!finished)
    {
        // Unblock the client loop so the runner can be joined.
        clientToProxy.writer->close();
    }
    runner.join();
    session.reset();

    if (!finished)
    {
        std::cerr << "run() must return once the language server stream ends\n";
        return false;
    }
    if (exitCode != 1)
    {
        std::cerr << "expected exit code 1 when the server ends first, got " << exitCode << "\n";
        return false;
    }

    // Client traffic after the session is gone has no reader left to act on it.
    if (!client.writeMessage(llvm::json::Object{{"jsonrpc", "2.0"}, {"method", "initialized"}, {"params", llvm::json::Object{}}}))
    {
        std::cerr << "client pipe must stay writable after the session ended\n";
        return false;
    }
    return true;
}

}  // namespace

bool runProxySessionTests()
{
    ::signal(SIGPIPE, SIG_IGN);

    const std::filesystem::path root    = makeUniqueTempDir();
    const std::filesystem::path project = root / "proj";
    std::error_code             ec;
    std::filesystem::create_directories(project / "src", ec);
    {
        std::ofstream manifest(project / "app.json");
        manifest << R"({"id":"00000000-0000-0000-0000-000000000001","name":"Proj","publisher":"Test"})";
    }
    const std::string projectRoot = alproxy::normalizePath(project.string());

    bool ok = true;
    {
        SessionHarness harness;
        if (!harness.start(testConfig()))
        {
            ok = false;
        }
        else
        {
            const bool scenarioOk = runLifecycleScenario(harness, projectRoot);
            const int  exitCode   = harness.finish(/*closeClient=*/!scenarioOk);
            if (scenarioOk && exitCode != 0)
            {
                std::cerr << "expected exit code 0 after shutdown and exit, got " << exitCode << "\n";
                ok = false;
            }
            if (scenarioOk && harness.session().telemetry().requestCount("workspace/symbol") != 2U)
            {
                std::cerr << "expected telemetry for both workspace/symbol requests\n";
                ok = false;
            }
            ok = ok && scenarioOk;
        }
    }

    if (ok)
    {
        SessionHarness harness;
        if (!harness.start(testConfig()))
        {
            ok = false;
        }
        else
        {
            (void) harness.send(request(1, "initialize", llvm::json::Object{{"processId", 1}}));
            const bool answered = harness.inbox().waitForResponse(1).has_value();
            const int  exitCode = harness.finish(/*closeClient=*/true);
            if (!answered || exitCode != 1)
            {
                std::cerr << "client EOF without shutdown must end the session with exit code 1\n";
                ok = false;
            }
        }
    }

    if (ok)
    {
        alproxy::lsp::ProxyConfig config = testConfig();
        const unsigned            attempts = config.projectLoad.maxAttempts;
        SessionHarness            harness;
        if (!harness.start(std::move(config), /*projectLoads=*/false))
        {
            ok = false;
        }
        else
        {
            const bool scenarioOk = runUnconfirmedProjectLoadScenario(harness, projectRoot, attempts);
            const int  exitCode   = harness.finish(/*closeClient=*/!scenarioOk);
            ok                    = scenarioOk && exitCode == 0;
        }
    }

    ok = ok && runServerClosesFirstScenario();

    std::filesystem::remove_all(root, ec);
    return ok;
}
