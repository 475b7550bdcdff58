#pragma once

/** \file filesystem.hpp
 *  \brief Cross-platform filesystem operations used by the storage layers.
 *
 * Provides:
 * - RAII file handles
 * - File and directory sync (fsync/FlushFileBuffers)
 * - Advisory whole-file locks that also conflict within one process
 * - Atomic, durable file replacement (write tmp, sync, rename, sync parent)
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "cairn/error.hpp"

#ifdef _WIN32
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#else
#include <cerrno>
#include <unistd.h>
#include <sys/stat.h>
#include <fcntl.h>
#endif

namespace cairn::platform {

/** \brief File handle wrapper for RAII.
 *
 * Automatically closes file on destruction.
 */
class FileHandle {
public:
#ifdef _WIN32
    using native_handle_type = HANDLE;
#else
    using native_handle_type = int;
#endif

    FileHandle() noexcept = default;

    explicit FileHandle(native_handle_type handle) noexcept
        : handle_(handle) {}

    ~FileHandle() {
        close();
    }

    FileHandle(FileHandle&& other) noexcept
        : handle_(other.handle_) {
        other.handle_ = invalid_handle();
    }

    auto operator=(FileHandle&& other) noexcept -> FileHandle& {
        if (this != &other) {
            close();
            handle_ = other.handle_;
            other.handle_ = invalid_handle();
        }
        return *this;
    }

    FileHandle(const FileHandle&) = delete;
    auto operator=(const FileHandle&) -> FileHandle& = delete;

    [[nodiscard]] auto get() const noexcept -> native_handle_type {
        return handle_;
    }

    [[nodiscard]] auto is_valid() const noexcept -> bool {
        return handle_ != invalid_handle();
    }

    auto close() noexcept -> void {
        if (is_valid()) {
#ifdef _WIN32
            ::CloseHandle(handle_);
#else
            ::close(handle_);
#endif
            handle_ = invalid_handle();
        }
    }

private:
    [[nodiscard]] static constexpr auto invalid_handle() noexcept -> native_handle_type {
#ifdef _WIN32
        return INVALID_HANDLE_VALUE;
#else
        return -1;
#endif
    }

    native_handle_type handle_ = invalid_handle();
};

/** \brief Map an OS error number to the library taxonomy. */
inline auto error_from_errno(int err, std::string message, std::string component) -> core::error {
    using core::error_code;
    error_code code = error_code::io_failed;
#ifndef _WIN32
    if (err == EACCES || err == EPERM || err == EROFS) code = error_code::permission_denied;
    else if (err == ENOENT) code = error_code::not_found;
#endif
    return core::error{code, std::move(message), std::move(component)};
}

/** \brief Map a std::filesystem error to the library taxonomy. */
inline auto error_from_ec(const std::error_code& ec, std::string message, std::string component) -> core::error {
    using core::error_code;
    error_code code = error_code::io_failed;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        code = error_code::permission_denied;
    }
    return core::error{code, std::move(message) + ": " + ec.message(), std::move(component)};
}

/** \brief Open a file for reading, or read/write when write_mode is set.
 *
 * \param create create the file if missing (never truncates)
 * \return handle, or error (permission_denied / not_found / io_failed)
 */
[[nodiscard]] inline auto open_file(const std::filesystem::path& path,
                                    bool write_mode = false,
                                    bool create = false)
    -> std::expected<FileHandle, core::error> {
#ifdef _WIN32
    DWORD access = write_mode ? (GENERIC_READ | GENERIC_WRITE) : GENERIC_READ;
    DWORD share = FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE;
    DWORD creation = create ? OPEN_ALWAYS : OPEN_EXISTING;
    HANDLE h = ::CreateFileW(path.c_str(), access, share, nullptr, creation,
                             FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return std::unexpected(core::error{core::error_code::io_failed,
                                           "open failed: " + path.string(), "platform.fs"});
    }
    return FileHandle(h);
#else
    int flags = write_mode ? O_RDWR : O_RDONLY;
    if (create) {
        flags |= O_CREAT;
    }
    flags |= O_CLOEXEC;
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        return std::unexpected(error_from_errno(errno, "open failed: " + path.string(), "platform.fs"));
    }
    return FileHandle(fd);
#endif
}

/** \brief Sync file data and metadata to disk. */
inline auto sync_file(const FileHandle& handle) noexcept -> bool {
    if (!handle.is_valid()) {
        return false;
    }
#ifdef _WIN32
    return ::FlushFileBuffers(handle.get()) != 0;
#elif defined(__APPLE__)
    return ::fcntl(handle.get(), F_FULLFSYNC) == 0;
#else
    return ::fsync(handle.get()) == 0;
#endif
}

/** \brief Best-effort sync of a directory entry table (after create/rename). */
inline auto sync_directory(const std::filesystem::path& dir) noexcept -> void {
#ifdef _WIN32
    HANDLE h = ::CreateFileW(dir.c_str(), GENERIC_READ,
                             FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                             nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
    if (h != INVALID_HANDLE_VALUE) {
        (void)::FlushFileBuffers(h);
        ::CloseHandle(h);
    }
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
        (void)::fsync(fd);
        (void)::close(fd);
    }
#endif
}

/** \brief Try to take a whole-file advisory lock without blocking.
 *
 * On Linux, open-file-description locks (F_OFD_SETLK) are used so that a second
 * handle in the same process conflicts as well; other POSIX systems fall back to
 * process-scoped F_SETLK.
 *
 * \param exclusive write lock when true, shared read lock otherwise
 * \return true if the lock was acquired
 */
inline auto try_lock_file(const FileHandle& handle, bool exclusive) noexcept -> bool {
    if (!handle.is_valid()) {
        return false;
    }
#ifdef _WIN32
    OVERLAPPED overlapped = {};
    DWORD flags = LOCKFILE_FAIL_IMMEDIATELY | (exclusive ? LOCKFILE_EXCLUSIVE_LOCK : 0);
    return ::LockFileEx(handle.get(), flags, 0, MAXDWORD, MAXDWORD, &overlapped) != 0;
#else
    struct flock fl = {};
    fl.l_type = exclusive ? F_WRLCK : F_RDLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
#if defined(F_OFD_SETLK)
    return ::fcntl(handle.get(), F_OFD_SETLK, &fl) != -1;
#else
    return ::fcntl(handle.get(), F_SETLK, &fl) != -1;
#endif
#endif
}

/** \brief Release a lock taken with try_lock_file. */
inline auto unlock_file(const FileHandle& handle) noexcept -> bool {
    if (!handle.is_valid()) {
        return false;
    }
#ifdef _WIN32
    OVERLAPPED overlapped = {};
    return ::UnlockFileEx(handle.get(), 0, MAXDWORD, MAXDWORD, &overlapped) != 0;
#else
    struct flock fl = {};
    fl.l_type = F_UNLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
#if defined(F_OFD_SETLK)
    return ::fcntl(handle.get(), F_OFD_SETLK, &fl) != -1;
#else
    return ::fcntl(handle.get(), F_SETLK, &fl) != -1;
#endif
#endif
}

/** \brief Atomically and durably replace `dst` with `bytes`.
 *
 * Sequence: write `<dst>.tmp`, fsync it, rename over `dst`, fsync the parent
 * directory. On failure the temporary file is removed and `dst` is untouched.
 */
auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error>;

/** \brief Read a whole file into memory. */
auto read_file(const std::filesystem::path& path)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace cairn::platform
