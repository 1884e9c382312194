#pragma once

#include <string>
#include <vector>

namespace Tabula {

/**
 * @brief seccomp-BPF allowlist for the sandbox worker process.
 * @details The allowlist covers what a running interpreter needs once its
 * inputs are in memory: memory management, reads and writes on descriptors it
 * already holds, futexes, clocks, signal plumbing and exit. Every other call
 * fails with EPERM; a foreign syscall ABI kills the process.
 * Called in the forked worker only, so nothing here logs.
 */
namespace SyscallFilter {

/**
 * @brief True when this build knows the audit architecture of the host ABI.
 */
bool supported() noexcept;

/**
 * @brief Syscall numbers allowed after installation.
 */
std::vector<int> allowedSyscalls();

/**
 * @brief Installs the filter on the calling thread (inherited by threads it creates).
 * @pre PR_SET_NO_NEW_PRIVS is already set, or the caller holds CAP_SYS_ADMIN.
 * @post On success every later syscall outside the allowlist returns EPERM.
 * @return Empty string on success, otherwise the reason the filter is absent.
 */
std::string install();

} // namespace SyscallFilter
} // namespace Tabula
