#ifndef PATHUTIL_HPP
#define PATHUTIL_HPP

#include "Common.hpp"

namespace hs
{
  struct MemAllocLinear;

  // Marker separating a filesystem provider name from the path, as in "FileSystem::/data".
  static const char kProviderSeparator[] = "::";

  // Skip everything up to and including the last provider marker.
  const char* PathStripProvider(const char* path);

  // Canonical form of a search root: provider prefix removed, and exactly one
  // trailing separator when the root is a directory. An empty root stays empty.
  const char* PathNormalizeRoot(MemAllocLinear* alloc, const char* search_root, bool root_is_directory);

  // `full_path` with `normalized_root` removed from its front, compared
  // without regard to ASCII case. If the root doesn't prefix the path the
  // whole path is returned. The result never starts with a separator unless
  // it is the whole path, and points into `full_path`.
  const char* PathRelativeToRoot(const char* full_path, const char* normalized_root);

  // Final path component. Points into `path`.
  const char* PathBaseName(const char* path);

  // Lowercased final component; the identity key used for matching.
  char* PathBaseNameLower(MemAllocLinear* alloc, const char* path);

  // Everything before the final component, without the separator. Empty for a bare name.
  char* PathParent(MemAllocLinear* alloc, const char* path);

  char* PathJoin(MemAllocLinear* alloc, const char* dir, const char* name);

  inline bool PathHasTrailingSeparator(const char* path, size_t len)
  {
    return len > 0 && path[len - 1] == HS_PATHSEP;
  }
}

#endif
