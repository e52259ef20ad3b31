//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Subprocess stdio transport implementation (fork/exec, epoll readers, line-delimited JSON-RPC)
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/JsonRpcMessageRouter.h"
#include "mcphost/PendingRequests.h"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/errors/Errors.h"

extern char** environ;

namespace mcphost {

namespace {
std::once_flag sigpipeOnce;

// Writes to a dead child's stdin must surface as EPIPE instead of terminating the host.
void ignoreSigpipe() {
    std::call_once(sigpipeOnce, []() {
        ::signal(SIGPIPE, SIG_IGN);
        LOG_DEBUG("StdioTransport: SIGPIPE ignored process-wide");
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::string describeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exit code {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return fmt::format("signal {}", WTERMSIG(status));
    }
    return "unknown status";
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

class StdioTransport::Impl {
public:
    StdioTransport::Options opts;
    std::string sessionId;
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    std::atomic<bool> killed{false};
    std::thread stdoutThread;
    std::thread stderrThread;
    std::mutex writeMutex;      // serializes whole-line writes to the child's stdin
    std::mutex pidMutex;        // guards reaped
    bool reaped{false};

    std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    RouterHandlers routerHandlers;
    std::unique_ptr<IJsonRpcMessageRouter> router{MakeDefaultJsonRpcMessageRouter()};
    PendingRequests pending;
    std::atomic<int64_t> requestCounter{0};
    std::atomic<uint64_t> requestTimeoutMs;

    explicit Impl(const StdioTransport::Options& o)
        : opts(o), requestTimeoutMs(ResolveRequestTimeoutMs(o.requestTimeoutMs)) {
        routerHandlers.requestHandler = AnswerServerRequest;
        routerHandlers.notificationHandler = [this](const JSONRPCNotification& n) {
            ITransport::NotificationHandler h;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                h = notificationHandler;
            }
            if (!h) {
                LOG_DEBUG("StdioTransport: dropping notification '{}' (no handler)", n.method);
                return;
            }
            try {
                h(n);
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: notification handler threw: {}", e.what());
            }
        };
    }

    ~Impl() {
        if (stdoutThread.joinable()) { stdoutThread.join(); }
        if (stderrThread.joinable()) { stderrThread.join(); }
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    [[noreturn]] void spawnFail(const std::string& what, int err) const {
        throw McpException(ErrorKind::SpawnFailure,
                           fmt::format("Failed to spawn MCP server '{}': {}: {}", opts.command, what, ::strerror(err)));
    }

    void spawn() {
        if (opts.command.empty()) {
            throw McpException(ErrorKind::SpawnFailure, "Failed to spawn MCP server: empty command");
        }
        ignoreSigpipe();

        // Everything the child touches is prepared before fork()
        std::vector<std::string> argvStore;
        argvStore.push_back(opts.command);
        argvStore.insert(argvStore.end(), opts.args.begin(), opts.args.end());
        std::vector<char*> argv;
        for (auto& a : argvStore) { argv.push_back(a.data()); }
        argv.push_back(nullptr);

        std::map<std::string, std::string> mergedEnv;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string kv(*e);
            auto eq = kv.find('=');
            if (eq != std::string::npos) {
                mergedEnv.emplace(kv.substr(0, eq), kv.substr(eq + 1));
            }
        }
        for (const auto& [k, v] : opts.env) {
            mergedEnv[k] = v;
        }
        std::vector<std::string> envStore;
        envStore.reserve(mergedEnv.size());
        for (const auto& [k, v] : mergedEnv) { envStore.push_back(k + "=" + v); }
        std::vector<char*> envp;
        for (auto& kv : envStore) { envp.push_back(kv.data()); }
        envp.push_back(nullptr);

        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};
        int errPipe[2] = {-1, -1};
        int statusPipe[2] = {-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            spawnFail("pipe creation failed", err);
        }

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            int err = errno;
            closeAll();
            spawnFail("eventfd creation failed", err);
        }

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            closeAll();
            spawnFail("fork failed", err);
        }
        if (child == 0) {
            // Child: only async-signal-safe calls from here on
            ::setpgid(0, 0);
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            if (::write(statusPipe[1], &err, sizeof(err)) < 0) {
                // parent observes EOF and a missing status; nothing else to report
            }
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);

        // The status pipe closes on successful exec (CLOEXEC) or carries errno on failure
        int childErr = 0;
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &childErr, sizeof(childErr));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
            closeAll();
            spawnFail("exec failed", childErr);
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        setNonBlocking(stdoutFd);
        setNonBlocking(stderrFd);
        sessionId = "stdio-" + std::to_string(pid);
        LOG_INFO("Spawned MCP server '{}' (pid {})", opts.command, static_cast<int>(pid));

        stdoutThread = std::thread([this]() {
            const bool eof = readLines(stdoutFd, [this](const std::string& line) { handleStdoutLine(line); });
            if (eof && !killed.load()) {
                LOG_INFO("StdioTransport: MCP server '{}' closed stdout", opts.command);
                pending.FailAll(fmt::format("MCP server '{}' closed its stdout", opts.command));
            }
        });
        stderrThread = std::thread([this]() {
            (void)readLines(stderrFd, [this](const std::string& line) {
                LOG_WARN("[mcp:{}] {}", opts.command, line);
            });
        });
    }

    //==========================================================================================================
    // readLines
    // Purpose: epoll loop over one child stream plus the wake eventfd, invoking onLine for every non-blank
    //          line. Returns true when the stream reached EOF, false when woken by Kill or on a read error.
    //==========================================================================================================
    bool readLines(int fd, const std::function<void(const std::string&)>& onLine) {
        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("StdioTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
            return false;
        }
        epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = fd;
        epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
        if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0 || ::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
            LOG_ERROR("StdioTransport: epoll_ctl failed (errno={} msg={})", errno, ::strerror(errno));
            ::close(ep);
            return false;
        }

        std::string buffer;
        std::array<char, 4096> tmp{};
        bool eof = false;
        bool running = true;
        while (running && !killed.load()) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("StdioTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                break;
            }
            for (int i = 0; i < rc; ++i) {
                // The eventfd is never drained so every reader observes the wakeup
                if (events[i].data.fd == wakeEventFd) {
                    running = false;
                }
            }
            if (!running) {
                break;
            }
            for (;;) {
                ssize_t n = ::read(fd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    continue;
                }
                if (n == 0) {
                    eof = true;
                    running = false;
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    running = false;
                }
                break;
            }
            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, pos);
                buffer.erase(0, pos + 1);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (!isBlank(line) && !killed.load()) {
                    onLine(line);
                }
            }
        }
        if (eof && !isBlank(buffer) && !killed.load()) {
            onLine(buffer);
        }
        ::close(ep);
        return eof;
    }

    void handleStdoutLine(const std::string& line) {
        LOG_DEBUG("StdioTransport: <- {}", line);
        auto reply = router->route(line, routerHandlers, [this](JSONRPCResponse&& r) {
            (void)pending.Resolve(std::move(r));
        });
        if (reply.has_value()) {
            try {
                writeLine(reply.value());
            } catch (const McpException& e) {
                LOG_WARN("StdioTransport: failed to answer server request: {}", e.what());
            }
        }
    }

    void writeLine(const std::string& payload) {
        std::lock_guard<std::mutex> lk(writeMutex);
        if (killed.load() || stdinFd < 0) {
            throw McpException(ErrorKind::TransportClosed,
                               fmt::format("MCP transport for '{}' is closed", opts.command));
        }
        std::string line = payload;
        line.push_back('\n');
        std::size_t off = 0;
        while (off < line.size()) {
            ssize_t w = ::write(stdinFd, line.data() + off, line.size() - off);
            if (w > 0) {
                off += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                throw McpException(ErrorKind::TransportError,
                                   fmt::format("Failed to write to MCP server '{}': {}", opts.command, ::strerror(errno)));
            }
        }
    }

    void wakeReaders() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void joinOrDetach(std::thread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            // Kill() invoked from a reader callback; the loop exits on its own once it returns
            t.detach();
        } else {
            t.join();
        }
    }
};

StdioTransport::StdioTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {
    FUNC_SCOPE();
    pImpl->spawn();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    Kill();
}

JSONRPCResponse StdioTransport::Request(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (pImpl->killed.load()) {
        throw McpException(ErrorKind::TransportClosed,
                           fmt::format("MCP transport for '{}' has been killed", pImpl->opts.command));
    }
    const int64_t id = ++pImpl->requestCounter;
    const std::string key = IdToKey(JSONRPCId{id});
    auto fut = pImpl->pending.Register(key);
    JSONRPCRequest request(id, method, std::move(params));
    try {
        pImpl->writeLine(request.Serialize());
    } catch (const McpException&) {
        (void)pImpl->pending.Remove(key);
        throw;
    }
    LOG_DEBUG("StdioTransport: -> {} (id {})", method, key);
    return pImpl->pending.Await(key, fut, method, std::chrono::milliseconds(pImpl->requestTimeoutMs.load()));
}

void StdioTransport::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    JSONRPCNotification notification(method, std::move(params));
    pImpl->writeLine(notification.Serialize());
    LOG_DEBUG("StdioTransport: -> {} (notification)", method);
}

bool StdioTransport::IsAlive() {
    FUNC_SCOPE();
    if (pImpl->killed.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lk(pImpl->pidMutex);
    if (pImpl->reaped || pImpl->pid <= 0) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pImpl->pid, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pImpl->pid) {
        pImpl->reaped = true;
        LOG_WARN("MCP server '{}' (pid {}) exited: {}", pImpl->opts.command, static_cast<int>(pImpl->pid),
                 describeWaitStatus(status));
    }
    return false;
}

void StdioTransport::Kill() {
    FUNC_SCOPE();
    if (pImpl->killed.exchange(true)) {
        return;
    }
    if (pImpl->pid > 0) {
        LOG_INFO("Killing MCP server '{}' (pid {})", pImpl->opts.command, static_cast<int>(pImpl->pid));
    }
    pImpl->wakeReaders();
    {
        std::lock_guard<std::mutex> lk(pImpl->pidMutex);
        if (!pImpl->reaped && pImpl->pid > 0) {
            // The child leads its own process group; take helpers it forked down with it
            if (::kill(-pImpl->pid, SIGKILL) != 0) {
                (void)::kill(pImpl->pid, SIGKILL);
            }
            int status = 0;
            while (::waitpid(pImpl->pid, &status, 0) < 0 && errno == EINTR) {}
            pImpl->reaped = true;
        }
    }
    pImpl->joinOrDetach(pImpl->stdoutThread);
    pImpl->joinOrDetach(pImpl->stderrThread);
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        closeFd(pImpl->stdinFd);
    }
    pImpl->pending.FailAll(fmt::format("MCP transport for '{}' was killed", pImpl->opts.command));
}

void StdioTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeoutMs.store(timeoutMs);
}

std::string StdioTransport::GetSessionId() const {
    FUNC_SCOPE();
    return pImpl->sessionId;
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

int StdioTransport::GetPid() const {
    return static_cast<int>(pImpl->pid);
}

} // namespace mcphost
