#include "FileInfo.hpp"
#include "Buffer.hpp"
#include "MemAllocLinear.hpp"
#include "PathUtil.hpp"

#include <string.h>
#include <stdlib.h>
#include <errno.h>

#include <sys/stat.h>
#include <unistd.h>
#include <dirent.h>

namespace hs
{

FileInfo GetFileInfo(const char* path)
{
  FileInfo result;
  struct stat stbuf;

  result.m_Flags      = 0;
  result.m_Timestamp  = 0;
  result.m_ChangeTime = 0;
  result.m_Size       = 0;

  if (0 == stat(path, &stbuf))
  {
    uint32_t flags = FileInfo::kFlagExists;

    if (S_ISDIR(stbuf.st_mode))
      flags |= FileInfo::kFlagDirectory;
    else if (S_ISREG(stbuf.st_mode))
      flags |= FileInfo::kFlagFile;

    struct stat lbuf;
    if (0 == lstat(path, &lbuf) && S_ISLNK(lbuf.st_mode))
      flags |= FileInfo::kFlagSymlink;

    if (0 == access(path, R_OK))
      flags |= FileInfo::kFlagReadable;

    result.m_Flags      = flags;
    result.m_Timestamp  = uint64_t(stbuf.st_mtime);
    result.m_ChangeTime = uint64_t(stbuf.st_ctime);
    result.m_Size       = uint64_t(stbuf.st_size);
  }
  else if (errno != ENOENT && errno != ENOTDIR)
  {
    result.m_Flags = FileInfo::kFlagError;
  }

  return result;
}

bool IsHiddenName(const char* name)
{
  return name[0] == '.';
}

struct EnumState
{
  bool              m_Recurse;
  bool              m_IncludeHiddenAndSystem;
  MemAllocHeap*     m_Heap;
  MemAllocLinear*   m_Alloc;
  void*             m_UserData;
  FileEntryCallback m_Callback;
};

static void MakeEntry(FileEntry* entry, const char* full_path, const char* name, const FileInfo& info)
{
  entry->m_FullPath    = full_path;
  entry->m_Name        = name;
  entry->m_SizeBytes   = info.m_Size;
  entry->m_CreatedUtc  = info.m_ChangeTime;
  entry->m_ModifiedUtc = info.m_Timestamp;
  entry->m_IsDirectory = info.IsDirectory();
  entry->m_IsReadable  = info.IsReadable();
  entry->m_IsSystem    = info.IsSystem();
}

static int SortStringPtrs(const void* l, const void* r)
{
  return strcmp(*(const char* const*) l, *(const char* const*) r);
}

static void ListDirectoryRecursive(EnumState* state, const char* path)
{
  DIR* dir = opendir(path);

  if (!dir)
  {
    Log(kWarning, "skipping directory %s: %s", path, strerror(errno));
    return;
  }

  Buffer<const char*> names;
  BufferInit(&names);

  while (struct dirent* ent = readdir(dir))
  {
    const char* name = ent->d_name;

    if (0 == strcmp(name, ".") || 0 == strcmp(name, ".."))
      continue;

    if (!state->m_IncludeHiddenAndSystem && IsHiddenName(name))
      continue;

    BufferAppendOne(&names, state->m_Heap, StrDup(state->m_Alloc, name));
  }

  closedir(dir);

  qsort(names.m_Storage, names.m_Size, sizeof(const char*), SortStringPtrs);

  for (const char* name : names)
  {
    const char* full_path = PathJoin(state->m_Alloc, path, name);
    FileInfo    info      = GetFileInfo(full_path);

    if (!info.Exists())
    {
      // Dangling symlink or a file deleted underneath us.
      Log(kDebug, "%s vanished during enumeration", full_path);
      continue;
    }

    if (!state->m_IncludeHiddenAndSystem && info.IsSystem())
      continue;

    FileEntry entry;
    MakeEntry(&entry, full_path, name, info);
    (*state->m_Callback)(state->m_UserData, entry);

    if (state->m_Recurse && info.IsDirectory())
    {
      if (info.IsSymlink())
        Log(kDebug, "not following symlinked directory %s", full_path);
      else
        ListDirectoryRecursive(state, full_path);
    }
  }

  BufferDestroy(&names, state->m_Heap);
}

bool EnumerateFiles(
    const char*       root,
    bool              recurse,
    bool              include_hidden_and_system,
    MemAllocHeap*     heap,
    MemAllocLinear*   alloc,
    void*             user_data,
    FileEntryCallback callback)
{
  FileInfo info = GetFileInfo(root);

  if (!info.Exists())
    return false;

  if (!info.IsDirectory())
  {
    const char* full_path = StrDup(alloc, root);
    FileEntry entry;
    MakeEntry(&entry, full_path, PathBaseName(full_path), info);
    (*callback)(user_data, entry);
    return true;
  }

  EnumState state;
  state.m_Recurse                = recurse;
  state.m_IncludeHiddenAndSystem = include_hidden_and_system;
  state.m_Heap                   = heap;
  state.m_Alloc                  = alloc;
  state.m_UserData               = user_data;
  state.m_Callback               = callback;

  ListDirectoryRecursive(&state, root);
  return true;
}

}
