#include "PathUtil.hpp"
#include "MemAllocLinear.hpp"

#include <string.h>

namespace hs
{

const char* PathStripProvider(const char* path)
{
  const char* result = path;
  for (const char* p = path; (p = strstr(p, kProviderSeparator)) != nullptr; )
  {
    p     += sizeof(kProviderSeparator) - 1;
    result = p;
  }
  return result;
}

const char* PathNormalizeRoot(MemAllocLinear* alloc, const char* search_root, bool root_is_directory)
{
  const char* root = PathStripProvider(search_root);
  size_t      len  = strlen(root);

  // "/data//" and "/data/" name the same root.
  if (root_is_directory)
  {
    while (len > 1 && root[len - 1] == HS_PATHSEP && root[len - 2] == HS_PATHSEP)
      --len;
  }

  if (!root_is_directory || 0 == len || PathHasTrailingSeparator(root, len))
    return StrDupN(alloc, root, len);

  char* result = static_cast<char*>(LinearAllocate(alloc, len + 2, 1));
  memcpy(result, root, len);
  result[len]     = HS_PATHSEP;
  result[len + 1] = '\0';
  return result;
}

const char* PathRelativeToRoot(const char* full_path, const char* normalized_root)
{
  if (!normalized_root[0] || !StrHasPrefixNoCase(full_path, normalized_root))
    return full_path;

  // Paths built from a root spelled "/R//" keep the extra separators.
  const char* relative = full_path + strlen(normalized_root);
  while (*relative == HS_PATHSEP)
    ++relative;

  return relative;
}

const char* PathBaseName(const char* path)
{
  const char* sep = strrchr(path, HS_PATHSEP);
  return sep ? sep + 1 : path;
}

char* PathBaseNameLower(MemAllocLinear* alloc, const char* path)
{
  char* result = StrDup(alloc, PathBaseName(path));
  StrLowerInPlace(result);
  return result;
}

char* PathParent(MemAllocLinear* alloc, const char* path)
{
  const char* sep = strrchr(path, HS_PATHSEP);

  if (!sep)
    return StrDup(alloc, "");

  // Keep the root separator of "/file".
  if (sep == path)
    return StrDup(alloc, HS_PATHSEP_STR);

  return StrDupN(alloc, path, size_t(sep - path));
}

char* PathJoin(MemAllocLinear* alloc, const char* dir, const char* name)
{
  size_t dir_len  = strlen(dir);
  size_t name_len = strlen(name);
  bool   need_sep = dir_len > 0 && !PathHasTrailingSeparator(dir, dir_len);

  char* result = static_cast<char*>(LinearAllocate(alloc, dir_len + name_len + 2, 1));
  char* out    = result;

  memcpy(out, dir, dir_len);
  out += dir_len;
  if (need_sep)
    *out++ = HS_PATHSEP;
  memcpy(out, name, name_len);
  out[name_len] = '\0';
  return result;
}

}
