#include "ociauth/auth/repository-address.hh"
#include "ociauth/util/strings.hh"

#include <regex>

namespace ociauth {

static const std::string hostLabelRegex = "[A-Za-z0-9](?:[A-Za-z0-9-]*[A-Za-z0-9])?";
static const std::string registryDomainRegex = hostLabelRegex + "(?:\\." + hostLabelRegex + ")*(?::[0-9]+)?";

/* A path component, as defined by the OCI distribution specification. */
static const std::string pathComponentRegex = "[a-z0-9]+(?:(?:\\.|_|__|-+)[a-z0-9]+)*";

std::string RepositoryAddress::to_string() const
{
    if (repositoryPath.empty())
        return registryDomain;
    return registryDomain + "/" + repositoryPath;
}

RepositoryAddress parseRepositoryAddressPrefix(std::string_view s)
{
    static std::regex domainRegex(registryDomainRegex, std::regex::ECMAScript);
    static std::regex componentRegex(pathComponentRegex, std::regex::ECMAScript);

    if (s.empty())
        throw BadRepositoryAddress("repository address must not be empty");

    RepositoryAddress addr;
    std::string_view path;
    bool hasPath = false;
    if (auto split = splitPrefixTo(s, '/')) {
        addr.registryDomain = std::string(split->first);
        path = split->second;
        hasPath = true;
    } else
        addr.registryDomain = std::string(s);

    if (path.find('@') != path.npos)
        throw BadRepositoryAddress("invalid repository \"%s\": must not include a tag or digest", s);

    if (!std::regex_match(addr.registryDomain, domainRegex)) {
        if (!hasPath && addr.registryDomain.find('@') != std::string::npos)
            throw BadRepositoryAddress("invalid repository \"%s\": must not include a tag or digest", s);
        throw BadRepositoryAddress("invalid registry domain \"%s\"", addr.registryDomain);
    }

    if (!hasPath)
        return addr;

    auto segments = splitString<std::vector<std::string>>(path, "/");
    if (segments.back().find(':') != std::string::npos)
        throw BadRepositoryAddress("invalid repository \"%s\": must not include a tag or digest", s);
    for (auto & segment : segments)
        if (!std::regex_match(segment, componentRegex))
            throw BadRepositoryAddress("invalid repository \"%s\"", s);

    addr.repositoryPath = std::string(path);
    return addr;
}

RepositoryAddress parseRepositoryAddress(std::string_view s)
{
    auto addr = parseRepositoryAddressPrefix(s);
    if (addr.repositoryPath.empty())
        throw BadRepositoryAddress(
            "invalid repository \"%s\": must include a repository path after the registry domain", s);
    return addr;
}

} // namespace ociauth
