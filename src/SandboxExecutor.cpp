#include "SandboxExecutor.h"

#include "Log.h"
#include "ResultCodec.h"
#include "ScriptInterpreter.h"
#include "ScriptParser.h"
#include "SyscallFilter.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <memory>
#include <regex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace Tabula {

namespace {

using Clock = std::chrono::steady_clock;

// Worker exit statuses read by the parent when no reply frame arrived.
constexpr int kExitOk = 0;
constexpr int kExitSetupFailed = 3;
constexpr int kExitOutOfMemory = 4;

constexpr size_t kFrameHeaderBytes = sizeof(uint64_t);
constexpr size_t kOpenFileLimit = 16;

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

bool writeAll(int fd, const char* data, size_t size) noexcept {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

bool writeFrame(int fd, const std::string& payload) noexcept {
    const uint64_t length = payload.size();
    char header[kFrameHeaderBytes];
    std::memcpy(header, &length, sizeof(length));
    return writeAll(fd, header, sizeof(header)) && writeAll(fd, payload.data(), payload.size());
}

// Virtual memory currently mapped by the calling process, in bytes.
rlim_t currentAddressSpace() {
    std::ifstream statm("/proc/self/statm");
    unsigned long long pages = 0;
    if (!(statm >> pages)) return 0;
    return static_cast<rlim_t>(pages) * static_cast<rlim_t>(::sysconf(_SC_PAGESIZE));
}

bool applyLimit(int resource, rlim_t soft, rlim_t hard) noexcept {
    rlimit rl{};
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    return ::setrlimit(resource, &rl) == 0;
}

void isolateDescriptors(int keepFd) noexcept {
    const int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
        ::dup2(devNull, STDOUT_FILENO);
        ::dup2(devNull, STDERR_FILENO);
    }
    rlimit rl{};
    int maxFd = 1024;
    if (::getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        maxFd = static_cast<int>(std::min<rlim_t>(rl.rlim_cur, 65536));
    }
    for (int fd = STDERR_FILENO + 1; fd < maxFd; ++fd) {
        if (fd != keepFd) ::close(fd);
    }
}

ExecutionResult failure(ErrorCode code, const std::string& error, Clock::time_point start) {
    ExecutionResult out;
    out.success = false;
    out.error = error;
    out.errorCode = code;
    out.executionTimeMs = elapsedMs(start);
    return out;
}

} // namespace

SandboxExecutor::SandboxExecutor(const SecurityPolicy& policy) : policy_(policy) {}

std::string SandboxExecutor::scrubErrorMessage(const std::string& message) {
    static const std::regex hostPath(R"((?:[A-Za-z]:)?(?:[\\/][\w.\-]+){2,}[\\/]?)");
    static const std::regex hexAddress(R"(0x[0-9A-Fa-f]+)");
    static const std::regex objectIdentity(R"(<([\w.]+) object at [^>]*>)");

    std::string text = message;
    // A multi-line trace is reduced to its final line.
    const size_t firstBreak = text.find('\n');
    if (firstBreak != std::string::npos) {
        size_t end = text.find_last_not_of("\r\n ");
        if (end == std::string::npos) end = firstBreak;
        const size_t lineStart = text.rfind('\n', end);
        text = text.substr(lineStart == std::string::npos ? 0 : lineStart + 1, end + 1 - (lineStart == std::string::npos ? 0 : lineStart + 1));
    }
    text = std::regex_replace(text, objectIdentity, "<$1 object>");
    text = std::regex_replace(text, hexAddress, "<address>");
    text = std::regex_replace(text, hostPath, "<path>");
    return text;
}

void SandboxExecutor::runWorker(int resultFd, const std::string& code, const DataFrame& dataset) const {
    int exitCode = kExitOk;
    try {
        isolateDescriptors(resultFd);
        ::setsid();

        // The private copy is made before the address-space cap so it never counts against the script.
        auto frame = std::make_shared<DataFrame>(dataset);

        const rlim_t baseline = currentAddressSpace();
        const rlim_t budget = static_cast<rlim_t>(policy_.maxMemoryMb) * 1024 * 1024;
        const rlim_t cpuSeconds = static_cast<rlim_t>(std::ceil(policy_.executionTimeoutSeconds)) + 1;
        bool limited = applyLimit(RLIMIT_AS, baseline + budget, baseline + budget);
        limited = applyLimit(RLIMIT_CPU, cpuSeconds, cpuSeconds + 1) && limited;
        limited = applyLimit(RLIMIT_FSIZE, 0, 0) && limited;
        limited = applyLimit(RLIMIT_NOFILE, kOpenFileLimit, kOpenFileLimit) && limited;
        limited = applyLimit(RLIMIT_NPROC, 0, 0) && limited;
        limited = applyLimit(RLIMIT_CORE, 0, 0) && limited;
        if (!limited || ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
            writeFrame(resultFd, ResultCodec::encodeFailure("SandboxError", "resource limits could not be applied"));
            ::_exit(kExitSetupFailed);
        }

        std::string note;
        if (policy_.syscallFilter != SyscallFilterMode::OFF) {
            const std::string reason = SyscallFilter::install();
            if (!reason.empty()) {
                if (policy_.syscallFilter == SyscallFilterMode::STRICT) {
                    writeFrame(resultFd, ResultCodec::encodeFailure("SandboxError", reason));
                    ::_exit(kExitSetupFailed);
                }
                note = reason;
            }
        }

        std::string payload;
        try {
            const Ast::Module module = ScriptParser::parse(code);
            ScriptInterpreter interpreter(policy_, frame);
            payload = ResultCodec::encodeSuccess(interpreter.run(module), note);
            if (payload.size() > policy_.maxResultBytes) {
                payload = ResultCodec::encodeFailure(
                    "ResultTooLarge", "result exceeds " + std::to_string(policy_.maxResultBytes) + " bytes", note);
            }
        } catch (const ScriptError& ex) {
            payload = ResultCodec::encodeFailure(ex.category(), ex.message(), note);
        } catch (const ScriptSyntaxError& ex) {
            payload = ResultCodec::encodeFailure("SyntaxError", ex.what(), note);
        } catch (const std::bad_alloc&) {
            payload = ResultCodec::encodeFailure("MemoryError", "out of memory", note);
        } catch (const std::length_error&) {
            payload = ResultCodec::encodeFailure("MemoryError", "out of memory", note);
        } catch (const std::exception& ex) {
            payload = ResultCodec::encodeFailure("RuntimeError", ex.what(), note);
        }
        if (!writeFrame(resultFd, payload)) exitCode = kExitSetupFailed;
    } catch (const std::bad_alloc&) {
        exitCode = kExitOutOfMemory;
    } catch (const std::exception&) {
        exitCode = kExitSetupFailed;
    }
    ::close(resultFd);
    ::_exit(exitCode);
}

ExecutionResult SandboxExecutor::execute(const std::string& sanitizedCode, const DataFrame& dataset) const {
    const auto start = Clock::now();
    const auto deadline = start + std::chrono::duration_cast<Clock::duration>(
                                      std::chrono::duration<double>(policy_.executionTimeoutSeconds));

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        Log::error("Sandbox", std::string("pipe failed: ") + std::strerror(errno));
        return failure(ErrorCode::EXECUTION_FAILED, "Execution error: could not start the sandbox worker", start);
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        Log::error("Sandbox", std::string("fork failed: ") + std::strerror(err));
        return failure(ErrorCode::EXECUTION_FAILED, "Execution error: could not start the sandbox worker", start);
    }
    if (pid == 0) {
        ::close(fds[0]);
        runWorker(fds[1], sanitizedCode, dataset);
    }

    ::close(fds[1]);
    const int readFd = fds[0];
    ::fcntl(readFd, F_SETFL, ::fcntl(readFd, F_GETFL) | O_NONBLOCK);

    const size_t maxFrame = kFrameHeaderBytes + policy_.maxResultBytes + 4096;
    std::string received;
    bool eof = false;
    bool timedOut = false;
    bool oversized = false;
    int status = 0;
    bool reaped = false;
    char buf[65536];

    while (!eof) {
        const auto now = Clock::now();
        if (now >= deadline) {
            timedOut = true;
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        pollfd pfd{readFd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(1, std::min<long long>(remaining, 100))));
        if (ready < 0 && errno != EINTR) break;
        if (ready <= 0) continue;
        while (true) {
            const ssize_t n = ::read(readFd, buf, sizeof(buf));
            if (n > 0) {
                received.append(buf, static_cast<size_t>(n));
                if (received.size() > maxFrame) {
                    oversized = true;
                    break;
                }
                continue;
            }
            if (n == 0) eof = true;
            else if (errno == EINTR) continue;
            break;
        }
        if (oversized) break;
    }

    // The worker closes the pipe only when exiting; give it until the deadline to be reaped.
    while (eof && !timedOut && !reaped) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
        } else if (w < 0 && errno != EINTR) {
            break;
        } else if (Clock::now() >= deadline) {
            timedOut = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    if (!reaped) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }
    ::close(readFd);

    if (timedOut) {
        const ExecutionTimeoutError err(policy_.executionTimeoutSeconds);
        Log::warn("Sandbox", err.what());
        return failure(err.code(), err.what(), start);
    }
    if (oversized) {
        return failure(ErrorCode::EXECUTION_FAILED,
                       "Execution error: result exceeds " + std::to_string(policy_.maxResultBytes) + " bytes", start);
    }
    if (reaped && WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        if (sig == SIGXCPU) {
            const ExecutionTimeoutError err(policy_.executionTimeoutSeconds);
            return failure(err.code(), err.what(), start);
        }
        if (sig == SIGKILL) {
            // Not sent by us: the kernel kills on memory exhaustion.
            const MemoryLimitError err(policy_.maxMemoryMb);
            Log::warn("Sandbox", err.what() + LogFields().add("signal", sig).str());
            return failure(err.code(), err.what(), start);
        }
        Log::warn("Sandbox", "worker terminated by signal" + LogFields().add("signal", sig).str());
        return failure(ErrorCode::RUNTIME_ERROR, "Execution error: worker terminated by signal " + std::to_string(sig), start);
    }
    if (reaped && WIFEXITED(status) && WEXITSTATUS(status) == kExitOutOfMemory) {
        const MemoryLimitError err(policy_.maxMemoryMb);
        return failure(err.code(), err.what(), start);
    }

    uint64_t length = 0;
    if (received.size() >= kFrameHeaderBytes) std::memcpy(&length, received.data(), sizeof(length));
    if (received.size() < kFrameHeaderBytes || received.size() - kFrameHeaderBytes != length) {
        Log::error("Sandbox", "worker exited without a complete reply" + LogFields().add("bytes", received.size()).str());
        return failure(ErrorCode::EXECUTION_FAILED, "Execution error: the sandbox worker returned no result", start);
    }

    WorkerReply reply;
    try {
        reply = ResultCodec::decodeReply(received.substr(kFrameHeaderBytes));
    } catch (const CodeExecutionError& ex) {
        Log::error("Sandbox", std::string(ex.what()) + LogFields().add("detail", ex.details()).str());
        return failure(ex.code(), "Execution error: the sandbox worker returned an unreadable result", start);
    }
    if (!reply.note.empty()) Log::warn("Sandbox", "best-effort isolation: " + reply.note);

    if (!reply.ok) {
        if (reply.category == "MemoryError") {
            const MemoryLimitError err(policy_.maxMemoryMb);
            return failure(err.code(), err.what(), start);
        }
        if (reply.category == "SandboxError") {
            Log::error("Sandbox", "worker setup failed: " + reply.message);
            return failure(ErrorCode::EXECUTION_FAILED, "Execution error: " + reply.message, start);
        }
        if (reply.category == "ResultTooLarge") {
            return failure(ErrorCode::EXECUTION_FAILED, "Execution error: " + reply.message, start);
        }
        return failure(ErrorCode::EXECUTION_FAILED, scrubErrorMessage(reply.category + ": " + reply.message), start);
    }

    ExecutionResult out;
    out.success = true;
    out.result = std::move(reply.value);
    out.executionTimeMs = elapsedMs(start);
    return out;
}

} // namespace Tabula
