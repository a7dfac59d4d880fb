#ifndef FILEINFO_HPP
#define FILEINFO_HPP

#include "Common.hpp"

namespace hs
{

struct MemAllocHeap;
struct MemAllocLinear;

struct FileInfo
{
  enum
  {
    kFlagExists       = 1 << 0,
    kFlagError        = 1 << 1,
    kFlagFile         = 1 << 2,
    kFlagDirectory    = 1 << 3,
    kFlagSymlink      = 1 << 4,
    kFlagReadable     = 1 << 5
  };

  uint32_t      m_Flags;
  uint64_t      m_Size;
  uint64_t      m_Timestamp;      // st_mtime
  uint64_t      m_ChangeTime;     // st_ctime, the closest POSIX has to a creation time

  bool Exists()      const { return 0 != (kFlagExists & m_Flags); }
  bool IsFile()      const { return 0 != (kFlagFile & m_Flags); }
  bool IsDirectory() const { return 0 != (kFlagDirectory & m_Flags); }
  bool IsSymlink()   const { return 0 != (kFlagSymlink & m_Flags); }
  bool IsReadable()  const { return 0 != (kFlagReadable & m_Flags); }

  // Devices, sockets, FIFOs and the like.
  bool IsSystem()    const { return Exists() && !IsFile() && !IsDirectory(); }
};

FileInfo GetFileInfo(const char* path);

// Dot files are hidden.
bool IsHiddenName(const char* name);

struct FileEntry
{
  const char* m_FullPath;
  const char* m_Name;
  uint64_t    m_SizeBytes;
  uint64_t    m_CreatedUtc;
  uint64_t    m_ModifiedUtc;
  bool        m_IsDirectory;
  bool        m_IsReadable;
  bool        m_IsSystem;
};

typedef void (*FileEntryCallback)(void* user_data, const FileEntry& entry);

// Reports `root` itself when it is a file, otherwise its entries in name
// order, descending into subdirectories when `recurse` is set. Symlinked
// directories are reported but not entered. Strings live in `alloc`.
// Returns false if `root` doesn't exist.
bool EnumerateFiles(
    const char*       root,
    bool              recurse,
    bool              include_hidden_and_system,
    MemAllocHeap*     heap,
    MemAllocLinear*   alloc,
    void*             user_data,
    FileEntryCallback callback);

}

#endif
