#pragma once
/**
 * @file
 *
 * Utilities for manipulating the file system.
 */

#include "ociauth/util/types.hh"
#include "ociauth/util/error.hh"

#include <optional>

namespace ociauth {

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise. The path
 * is also canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {});

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes. Symlinks are not resolved.
 */
Path canonPath(PathView path);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`. If the path is the root or an
 * immediate child thereof (e.g., `/foo`), this means `/`
 * is returned.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Check whether 'path' is absolute.
 */
bool isAbsolute(PathView path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const Path & path);

/**
 * Read the contents of a file into a string.
 *
 * @throws SysError with `errNo == ENOENT` if the file does not exist.
 */
std::string readFile(const Path & path);

/**
 * Join path components with `/`, without canonicalising the result.
 */
Path joinPath(const Path & base, const std::string & name);

} // namespace ociauth
