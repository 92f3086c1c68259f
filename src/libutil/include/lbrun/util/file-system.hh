#pragma once
///@file

#include "lbrun/util/error.hh"
#include "lbrun/util/types.hh"

#include <filesystem>
#include <optional>

#include <sys/types.h>

namespace lbrun {

/**
 * `path` made absolute against `dir` (the current directory by
 * default) and canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {});

/**
 * Remove `.` and `..` components and redundant slashes from an absolute
 * path without resolving symlinks, e.g. "/a/./b/../c/" becomes "/a/c".
 */
Path canonPath(PathView path);

/**
 * Everything before the last `/`; "/" for "/foo" and "." if there is no
 * slash.
 */
Path dirOf(PathView path);

/**
 * The last component of `path`, ignoring trailing slashes.
 */
std::string_view baseNameOf(std::string_view path);

bool pathExists(const Path & path);

std::string readFile(const Path & path);

/**
 * Create or truncate `path`, write `s` and set its permission bits to
 * `mode` regardless of the umask.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

void createDirs(const Path & path);

/**
 * Delete `path` recursively. A missing path is not an error.
 */
void deletePath(const std::filesystem::path & path);

/**
 * Copy the regular file `from` to `to`, replacing `to` if it exists.
 */
void copyFile(const Path & from, const Path & to);

/**
 * Deletes a file or directory tree when it goes out of scope, unless
 * cancelled.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del = true;
    bool recursive;

public:
    explicit AutoDelete(const std::filesystem::path & p, bool recursive = true);
    AutoDelete(AutoDelete && other) noexcept;
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;
    ~AutoDelete();

    void cancel()
    {
        del = false;
    }

    const std::filesystem::path & path() const
    {
        return _path;
    }
};

/**
 * `TMPDIR`, or "/tmp" if it is unset or empty.
 */
Path defaultTempDir();

/**
 * Create a fresh directory `<tmpRoot>/<prefix>-<pid>-<n>`.
 */
Path createTempDir(const Path & tmpRoot = "", const std::string & prefix = "lbrun", mode_t mode = 0755);

} // namespace lbrun
