#include "lbrun/util/file-system.hh"
#include "lbrun/util/file-descriptor.hh"
#include "lbrun/util/strings.hh"
#include "lbrun/util/util.hh"

#include <atomic>
#include <cerrno>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lbrun {

Path absPath(PathView path, std::optional<PathView> dir)
{
    if (!path.empty() && path[0] == '/')
        return canonPath(path);

    Path base;
    if (dir)
        base = *dir;
    else {
        std::error_code ec;
        base = std::filesystem::current_path(ec).string();
        if (ec)
            throw SysError(ec.value(), "getting the current directory");
    }
    return canonPath(base + "/" + std::string(path));
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%s'", path);

    std::vector<std::string> components;
    for (auto & c : tokenizeString<std::vector<std::string>>(path, "/")) {
        if (c == ".")
            continue;
        if (c == "..") {
            if (!components.empty())
                components.pop_back();
        } else
            components.push_back(std::move(c));
    }

    if (components.empty())
        return "/";
    return "/" + concatStringsSep("/", components);
}

Path dirOf(PathView path)
{
    auto slash = path.rfind('/');
    if (slash == path.npos)
        return ".";
    if (slash == 0)
        return "/";
    return Path(path.substr(0, slash));
}

std::string_view baseNameOf(std::string_view path)
{
    while (path.size() > 1 && path.back() == '/')
        path.remove_suffix(1);
    auto slash = path.rfind('/');
    return slash == path.npos ? path : path.substr(slash + 1);
}

bool pathExists(const Path & path)
{
    struct stat st;
    if (lstat(path.c_str(), &st) == 0)
        return true;
    if (errno == ENOENT || errno == ENOTDIR)
        return false;
    throw SysError("getting status of '%s'", path);
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%s'", path);
    return readFile(fd.get());
}

void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%s'", path);
    try {
        writeFull(fd.get(), s);
    } catch (Error & e) {
        e.addPrefix("writing file '%s': ", path);
        throw;
    }
    if (fchmod(fd.get(), mode) == -1)
        throw SysError("changing permissions of '%s'", path);
    fd.close();
}

void createDirs(const Path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%s'", path);
}

void deletePath(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw SysError(ec.value(), "deleting '%s'", path.string());
}

void copyFile(const Path & from, const Path & to)
{
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
        throw SysError(ec.value(), "copying '%s' to '%s'", from, to);
}

AutoDelete::AutoDelete(const std::filesystem::path & p, bool recursive)
    : _path(p)
    , recursive(recursive)
{
}

AutoDelete::AutoDelete(AutoDelete && other) noexcept
    : _path(std::move(other._path))
    , del(std::exchange(other.del, false))
    , recursive(other.recursive)
{
}

AutoDelete::~AutoDelete()
{
    if (!del)
        return;
    try {
        if (recursive)
            deletePath(_path);
        else
            std::filesystem::remove(_path);
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

Path defaultTempDir()
{
    return getEnvNonEmpty("TMPDIR").value_or("/tmp");
}

Path createTempDir(const Path & tmpRoot, const std::string & prefix, mode_t mode)
{
    static std::atomic<unsigned int> counter{0};

    auto root = canonPath(tmpRoot.empty() ? defaultTempDir() : tmpRoot);
    for (;;) {
        auto dir = fmt("%s/%s-%d-%d", root, prefix, getpid(), counter++);
        if (mkdir(dir.c_str(), mode) == 0)
            return dir;
        if (errno != EEXIST)
            throw SysError("creating directory '%s'", dir);
    }
}

} // namespace lbrun
