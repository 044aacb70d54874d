#include "ociauth/util/file-system.hh"
#include "ociauth/util/file-descriptor.hh"
#include "ociauth/util/strings.hh"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <climits>

namespace ociauth {

bool isAbsolute(PathView path)
{
    return !path.empty() && path[0] == '/';
}

Path absPath(PathView path, std::optional<PathView> dir)
{
    std::string scratch;

    if (!isAbsolute(path)) {
        // In this case we need to call `canonPath` on a newly-created
        // string. We set `scratch` to that string first, and then set
        // `path` to `scratch`. This ensures the newly-created string
        // lives long enough for the call to `canonPath`, and allows us
        // to just accept a `std::string_view`.
        if (!dir) {
            char buf[PATH_MAX];
            if (!getcwd(buf, sizeof(buf)))
                throw SysError("cannot get cwd");
            scratch = concatStringsSep("/", std::vector<std::string>{buf, std::string(path)});
        } else
            scratch = concatStringsSep("/", std::vector<std::string>{std::string(*dir), std::string(path)});
        path = scratch;
    }
    return canonPath(path);
}

Path canonPath(PathView path)
{
    if (!isAbsolute(path))
        throw Error("not an absolute path: '%1%'", path);

    std::vector<std::string> components;
    for (auto & c : tokenizeString<std::vector<std::string>>(path, "/")) {
        if (c == ".")
            continue;
        if (c == "..") {
            if (!components.empty())
                components.pop_back();
            continue;
        }
        components.push_back(c);
    }

    return "/" + concatStringsSep("/", components);
}

Path dirOf(const PathView path)
{
    Path::size_type pos = path.rfind('/');
    if (pos == path.npos)
        return ".";
    return pos == 0 ? "/" : Path(path, 0, pos);
}

std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    while (last > 0 && path[last] == '/')
        last -= 1;

    auto pos = path.rfind('/', last);
    if (pos == path.npos)
        pos = 0;
    else
        pos += 1;

    return path.substr(pos, last - pos + 1);
}

bool pathExists(const Path & path)
{
    struct stat st;
    if (stat(path.c_str(), &st) == 0)
        return true;
    if (errno != ENOENT && errno != ENOTDIR)
        throw SysError("getting status of %1%", path);
    return false;
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

Path joinPath(const Path & base, const std::string & name)
{
    if (base.empty())
        return name;
    if (hasSuffix(base, "/"))
        return base + name;
    return base + "/" + name;
}

} // namespace ociauth
