#ifndef DOCREDACT_UTIL_SECURE_TEMP_FILE_HPP
#define DOCREDACT_UTIL_SECURE_TEMP_FILE_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "util/hashing.hpp"
#include "util/logger.hpp"

/**
 * @file secure_temp_file.hpp
 * @brief RAII temp file used for redacted output before it is verified.
 *
 * DESIGN:
 *   - The file is created with O_CREAT|O_EXCL and mode 0600 in the directory
 *     of the final destination, so commit() can hard-link it into place.
 *   - commit() never replaces an existing destination: link() fails with
 *     EEXIST instead, and the temp file stays uncommitted.
 *   - Until commit() succeeds the file is considered unsafe: the destructor
 *     overwrites it with random bytes, fsyncs and unlinks it.
 *
 * USAGE:
 *   @code
 *   docredact::util::SecureTempFile tmp("/out/report.pdf");
 *   tmp.write(bytes);
 *   auto onDisk = tmp.readBack();
 *   tmp.commit("/out/report.pdf");
 *   @endcode
 */

namespace docredact {
namespace util {

/**
 * @brief Best-effort overwrite + unlink of an existing file.
 * @return true if the file no longer exists afterwards.
 */
inline bool secureDelete(const std::string &path)
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }

    int fd = ::open(path.c_str(), O_WRONLY);
    if (fd >= 0) {
        const size_t chunk = 8192;
        size_t remaining = static_cast<size_t>(st.st_size);
        bool ok = true;
        while (remaining > 0 && ok) {
            size_t n = remaining < chunk ? remaining : chunk;
            std::vector<uint8_t> noise = hashing::randomBytes(n);
            ssize_t written = ::write(fd, noise.data(), n);
            if (written <= 0) {
                ok = false;
                break;
            }
            remaining -= static_cast<size_t>(written);
        }
        if (!ok) {
            logger::warn("[SecureTempFile] Overwrite pass incomplete before unlink.");
        }
        ::fsync(fd);
        ::close(fd);
    }
    else {
        logger::warn("[SecureTempFile] Could not open file for overwrite: " + std::string(std::strerror(errno)));
    }

    if (::unlink(path.c_str()) != 0) {
        logger::error("[SecureTempFile] unlink failed: " + std::string(std::strerror(errno)));
        return false;
    }
    return true;
}

/**
 * @class SecureTempFile
 * @brief A uniquely named file next to a target path, removed securely unless committed.
 */
class SecureTempFile
{
public:
    /**
     * @param targetPath The final destination. The temp file lives in the same directory.
     * @throw std::runtime_error if the file cannot be created.
     */
    explicit SecureTempFile(const std::string &targetPath)
        : committed_(false)
    {
        std::string dir = ".";
        auto slash = targetPath.find_last_of('/');
        if (slash != std::string::npos) {
            dir = (slash == 0) ? "/" : targetPath.substr(0, slash);
        }

        for (int attempt = 0; attempt < 8; ++attempt) {
            std::string candidate = dir + (dir == "/" ? "" : "/") + ".docredact-" + hashing::randomHex(8) + ".tmp";
            int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0600);
            if (fd >= 0) {
                ::close(fd);
                path_ = candidate;
                return;
            }
            if (errno != EEXIST) {
                throw std::runtime_error("SecureTempFile: cannot create temp file in " + dir + ": "
                                         + std::strerror(errno));
            }
        }
        throw std::runtime_error("SecureTempFile: exhausted unique name attempts in " + dir);
    }

    ~SecureTempFile()
    {
        if (!committed_ && !path_.empty()) {
            secureDelete(path_);
        }
    }

    SecureTempFile(const SecureTempFile&) = delete;
    SecureTempFile& operator=(const SecureTempFile&) = delete;

    const std::string& path() const
    {
        return path_;
    }

    /**
     * @brief Replace the file contents with @p bytes and fsync.
     * @throw std::runtime_error on any I/O failure.
     */
    void write(const std::vector<uint8_t> &bytes)
    {
        int fd = ::open(path_.c_str(), O_WRONLY | O_TRUNC);
        if (fd < 0) {
            throw std::runtime_error("SecureTempFile: open for write failed: " + std::string(std::strerror(errno)));
        }
        size_t offset = 0;
        while (offset < bytes.size()) {
            ssize_t n = ::write(fd, bytes.data() + offset, bytes.size() - offset);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                ::close(fd);
                throw std::runtime_error("SecureTempFile: write failed: " + std::string(std::strerror(err)));
            }
            offset += static_cast<size_t>(n);
        }
        if (::fsync(fd) != 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error("SecureTempFile: fsync failed: " + std::string(std::strerror(err)));
        }
        ::close(fd);
    }

    /**
     * @brief Read the current file contents back from disk.
     */
    std::vector<uint8_t> readBack() const
    {
        std::FILE *fp = std::fopen(path_.c_str(), "rb");
        if (!fp) {
            throw std::runtime_error("SecureTempFile: reopen failed: " + std::string(std::strerror(errno)));
        }
        std::vector<uint8_t> out;
        uint8_t buffer[8192];
        size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), fp)) > 0) {
            out.insert(out.end(), buffer, buffer + n);
        }
        bool failed = std::ferror(fp) != 0;
        std::fclose(fp);
        if (failed) {
            throw std::runtime_error("SecureTempFile: read back failed for " + path_);
        }
        return out;
    }

    /**
     * @brief Publish the temp file as @p targetPath without overwriting anything.
     * @return false if @p targetPath already exists; the temp file is left
     *         uncommitted and is wiped by the destructor.
     * @throw std::runtime_error if the link cannot be created for any other reason.
     */
    bool commit(const std::string &targetPath)
    {
        if (::link(path_.c_str(), targetPath.c_str()) != 0) {
            if (errno == EEXIST) {
                return false;
            }
            throw std::runtime_error("SecureTempFile: link to destination failed: "
                                     + std::string(std::strerror(errno)));
        }
        committed_ = true;
        if (::unlink(path_.c_str()) != 0) {
            logger::warn("[SecureTempFile] Could not remove temp name after commit: "
                         + std::string(std::strerror(errno)));
        }
        return true;
    }

    bool committed() const
    {
        return committed_;
    }

private:
    std::string path_;
    bool committed_;
};

} // namespace util
} // namespace docredact

#endif // DOCREDACT_UTIL_SECURE_TEMP_FILE_HPP
