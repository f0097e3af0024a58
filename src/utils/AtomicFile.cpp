/**
 * @file AtomicFile.cpp
 * @brief Platform-aware atomic JSON write and tolerant JSON read.
 *
 * POSIX:
 *  - mkstemp() a temp file beside the target, write, fsync, copy the target's
 *    permissions, close
 *  - flock the target, rename temp over target, unlock, fsync the directory
 *
 * Windows:
 *  - write and flush a uniquely named temp file, then ReplaceFileW (or
 *    MoveFileExW when the target does not exist yet) with write-through
 */
#include "platform.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#if ELWORKBENCH_IS_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace elworkbench::utils
{

namespace fs = std::filesystem;

namespace
{

bool fail(std::error_code *ec, std::error_code code)
{
    if (ec)
        *ec = code;
    return false;
}

#if !ELWORKBENCH_IS_WINDOWS
std::error_code errno_code(int errnum)
{
    return std::error_code(errnum, std::generic_category());
}

bool write_all(int fd, const std::string &out)
{
    const char *buf = out.data();
    size_t remaining = out.size();
    while (remaining > 0)
    {
        ssize_t w = ::write(fd, buf, remaining);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        buf += w;
        remaining -= static_cast<size_t>(w);
    }
    return true;
}
#endif

} // namespace

bool atomic_write_json(const fs::path &target, const nlohmann::json &j,
                       std::error_code *ec) noexcept
{
    if (ec)
        *ec = std::error_code{};

    std::string out;
    try
    {
        out = j.dump(4);
    }
    catch (const std::exception &ex)
    {
        // nlohmann throws type_error on invalid UTF-8 strings.
        LOGGER_ERROR("atomic_write_json: cannot serialize document for '{}': {}", target.string(),
                     ex.what());
        return fail(ec, std::make_error_code(std::errc::invalid_argument));
    }

    fs::path parent = target.parent_path();
    if (parent.empty())
        parent = ".";

    std::error_code create_ec;
    fs::create_directories(parent, create_ec);
    if (create_ec)
    {
        LOGGER_ERROR("atomic_write_json: create_directories failed for {}: {}", parent.string(),
                     create_ec.message());
        return fail(ec, create_ec);
    }

#if ELWORKBENCH_IS_WINDOWS
    const std::wstring tmp_w = (parent / (target.filename().wstring() + L".tmp" +
                                          std::to_wstring(GetCurrentProcessId()) + L"_" +
                                          std::to_wstring(GetTickCount64())))
                                   .wstring();
    const std::wstring target_w = target.wstring();

    HANDLE h = CreateFileW(tmp_w.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        LOGGER_ERROR("atomic_write_json: CreateFileW(temp) failed for '{}'. Error: {}",
                     target.string(), GetLastError());
        return fail(ec, std::make_error_code(std::errc::io_error));
    }

    DWORD written = 0;
    BOOL ok = WriteFile(h, out.data(), static_cast<DWORD>(out.size()), &written, nullptr);
    ok = ok && written == static_cast<DWORD>(out.size()) && FlushFileBuffers(h);
    CloseHandle(h);
    if (!ok)
    {
        DeleteFileW(tmp_w.c_str());
        LOGGER_ERROR("atomic_write_json: write failed for '{}'. Error: {}", target.string(),
                     GetLastError());
        return fail(ec, std::make_error_code(std::errc::io_error));
    }

    std::error_code exists_ec;
    BOOL replaced = fs::exists(target, exists_ec)
                        ? ReplaceFileW(target_w.c_str(), tmp_w.c_str(), nullptr,
                                       REPLACEFILE_WRITE_THROUGH, nullptr, nullptr)
                        : MoveFileExW(tmp_w.c_str(), target_w.c_str(), MOVEFILE_WRITE_THROUGH);
    if (!replaced)
    {
        LOGGER_ERROR("atomic_write_json: replace failed for '{}'. Error: {}", target.string(),
                     GetLastError());
        DeleteFileW(tmp_w.c_str());
        return fail(ec, std::make_error_code(std::errc::io_error));
    }
    return true;
#else
    struct stat lstat_buf;
    if (::lstat(target.c_str(), &lstat_buf) == 0 && S_ISLNK(lstat_buf.st_mode))
    {
        LOGGER_ERROR("atomic_write_json: target '{}' is a symbolic link, refusing to write",
                     target.string());
        return fail(ec, std::make_error_code(std::errc::operation_not_permitted));
    }

    const std::string dir = parent.string();
    const std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = ::mkstemp(tmpl_buf.data());
    if (fd == -1)
    {
        int errnum = errno;
        LOGGER_ERROR("atomic_write_json: mkstemp failed for '{}'. Error: {}", tmpl,
                     std::strerror(errnum));
        return fail(ec, errno_code(errnum));
    }
    const std::string tmp_path = tmpl_buf.data();

    auto abandon = [&](const char *what, int errnum) {
        if (fd != -1)
            ::close(fd);
        ::unlink(tmp_path.c_str());
        LOGGER_ERROR("atomic_write_json: {} failed for '{}'. Error: {}", what, target.string(),
                     std::strerror(errnum));
        return fail(ec, errno_code(errnum));
    };

    if (!write_all(fd, out))
        return abandon("write", errno);
    if (::fsync(fd) != 0)
        return abandon("fsync(file)", errno);

    struct stat st;
    if (::stat(target.c_str(), &st) == 0 && ::fchmod(fd, st.st_mode) != 0)
        return abandon("fchmod", errno);

    if (::close(fd) != 0)
    {
        fd = -1;
        return abandon("close", errno);
    }
    fd = -1;

    // Exclusive flock on an existing target keeps concurrent writers from interleaving
    // renames. The target is not created here: a failed rename must leave no file behind.
    int target_fd = ::open(target.c_str(), O_RDWR);
    if (target_fd == -1 && errno != ENOENT)
        return abandon("open(target)", errno);
    if (target_fd != -1 && ::flock(target_fd, LOCK_EX) != 0)
    {
        int errnum = errno;
        ::close(target_fd);
        return abandon("flock(target)", errnum);
    }
    auto unlock_target = [&target_fd] {
        if (target_fd != -1)
        {
            ::flock(target_fd, LOCK_UN);
            ::close(target_fd);
        }
    };
    if (std::rename(tmp_path.c_str(), target.c_str()) != 0)
    {
        int errnum = errno;
        unlock_target();
        return abandon("rename", errnum);
    }
    unlock_target();

    int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY);
    if (dfd < 0)
    {
        int errnum = errno;
        LOGGER_ERROR("atomic_write_json: open(dir) failed for fsync: '{}'. Error: {}", dir,
                     std::strerror(errnum));
        return fail(ec, errno_code(errnum));
    }
    if (::fsync(dfd) != 0)
    {
        int errnum = errno;
        ::close(dfd);
        LOGGER_ERROR("atomic_write_json: fsync(dir) failed for '{}'. Error: {}", dir,
                     std::strerror(errnum));
        return fail(ec, errno_code(errnum));
    }
    ::close(dfd);
    return true;
#endif
}

std::optional<nlohmann::json> read_json_file(const fs::path &path, std::error_code *ec) noexcept
{
    if (ec)
        *ec = std::error_code{};
    try
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            fail(ec, std::make_error_code(std::errc::no_such_file_or_directory));
            return std::nullopt;
        }
        nlohmann::json j;
        in >> j;
        return j;
    }
    catch (const nlohmann::json::exception &ex)
    {
        LOGGER_WARN("read_json_file: '{}' is not valid JSON: {}", path.string(), ex.what());
        fail(ec, std::make_error_code(std::errc::invalid_argument));
        return std::nullopt;
    }
    catch (const std::exception &ex)
    {
        LOGGER_ERROR("read_json_file: cannot read '{}': {}", path.string(), ex.what());
        fail(ec, std::make_error_code(std::errc::io_error));
        return std::nullopt;
    }
}

} // namespace elworkbench::utils
