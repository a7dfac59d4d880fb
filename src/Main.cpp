#include "Driver.hpp"
#include "Common.hpp"
#include "HttpClient.hpp"
#include "SignalHandler.hpp"

#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace OptionType
{
  enum Enum
  {
    kFlag,
    kInt,
    kString,
    kOptionalString   // --name or --name=value; the bare form stores ""
  };
}

static const struct OptionTemplate
{
  char              m_ShortName;
  const char       *m_LongName;
  OptionType::Enum  m_Type;
  size_t            m_Offset;
  const char       *m_Help;
} g_OptionTemplates[] = {
  { 'r', "recurse", OptionType::kFlag, offsetof(hs::DriverOptions, m_Recurse),
    "Descend into subdirectories" },
  { 'a', "all", OptionType::kFlag, offsetof(hs::DriverOptions, m_IncludeAll),
    "Include hidden and system entries" },
  { 'V', "version-info", OptionType::kFlag, offsetof(hs::DriverOptions, m_VersionInfo),
    "Collect version resource data" },
  { 'C', "cert-info", OptionType::kFlag, offsetof(hs::DriverOptions, m_CertificateInfo),
    "Collect signing certificate data" },
  { 'P', "root-path", OptionType::kFlag, offsetof(hs::DriverOptions, m_RootPath),
    "Disclose full paths in the output" },
  { 'A', "algorithms", OptionType::kString, offsetof(hs::DriverOptions, m_Algorithms),
    "Comma separated list of MD5, SHA1, SHA256, SHA512" },
  { 'R', "reference", OptionType::kString, offsetof(hs::DriverOptions, m_ReferenceFile),
    "Verify against reference data (JSON or CSV)" },
  { 'L', "repository", OptionType::kOptionalString, offsetof(hs::DriverOptions, m_RepositoryUri),
    "Look up digests in a signature repository (default " HASHSIG_DEFAULT_REPOSITORY_URI ")" },
  { 'T', "reference-template", OptionType::kFlag, offsetof(hs::DriverOptions, m_ReferenceTemplate),
    "Write an empty reference record and exit" },
  { 'm', "placeholder", OptionType::kString, offsetof(hs::DriverOptions, m_Placeholder),
    "Text for match results with nothing to compare (default " HASHSIG_DEFAULT_MISSING_PLACEHOLDER ")" },
  { 'f', "format", OptionType::kString, offsetof(hs::DriverOptions, m_Format),
    "Output format: csv or json" },
  { 'o', "output", OptionType::kString, offsetof(hs::DriverOptions, m_OutputFile),
    "Write output to a file instead of stdout" },
  { 'j', "threads", OptionType::kInt, offsetof(hs::DriverOptions, m_ThreadCount),
    "Hashing threads (default: one per CPU)" },
  { 'n', "max-requests", OptionType::kInt, offsetof(hs::DriverOptions, m_MaxRequests),
    "Concurrent repository requests (default 4)" },
  { 'w', "request-timeout", OptionType::kInt, offsetof(hs::DriverOptions, m_RequestTimeout),
    "Per-request timeout in seconds (default 30)" },
  { 't', "timeout", OptionType::kInt, offsetof(hs::DriverOptions, m_Timeout),
    "Cancel the run after this many seconds" },
  { 'p', "progress", OptionType::kFlag, offsetof(hs::DriverOptions, m_ShowProgress),
    "Report progress on stderr" },
  { 's', "stats", OptionType::kFlag, offsetof(hs::DriverOptions, m_DisplayStats),
    "Print timing and counters when done" },
  { 'v', "verbose", OptionType::kFlag, offsetof(hs::DriverOptions, m_Verbose),
    "Enable informational messages" },
  { 'D', "debug", OptionType::kFlag, offsetof(hs::DriverOptions, m_DebugMessages),
    "Enable debug messages" },
  { 'q', "quiet", OptionType::kFlag, offsetof(hs::DriverOptions, m_Quiet),
    "Only report errors" },
  { 'h', "help", OptionType::kFlag, offsetof(hs::DriverOptions, m_ShowHelp),
    "Show this help" }
};

// Matches "-x" or "--name" (name_len excludes any "=value").
static const OptionTemplate* FindOption(const char* arg, size_t name_len, bool is_long)
{
  for (const OptionTemplate& templ : g_OptionTemplates)
  {
    if (is_long)
    {
      if (strlen(templ.m_LongName) == name_len && 0 == strncmp(arg, templ.m_LongName, name_len))
        return &templ;
    }
    else if (arg[0] == templ.m_ShortName)
    {
      return &templ;
    }
  }
  return nullptr;
}

static bool StoreOption(hs::DriverOptions* options, const OptionTemplate* templ, const char* spelled, const char* value)
{
  void* field = reinterpret_cast<char*>(options) + templ->m_Offset;

  switch (templ->m_Type)
  {
    case OptionType::kFlag:
      if (value)
      {
        fprintf(stderr, "%s doesn't take a value\n", spelled);
        return false;
      }
      *static_cast<bool*>(field) = true;
      return true;

    case OptionType::kOptionalString:
      *static_cast<const char**>(field) = value ? value : "";
      return true;

    case OptionType::kString:
      *static_cast<const char**>(field) = value;
      return true;

    case OptionType::kInt:
      {
        char* end;
        long number = strtol(value, &end, 10);
        if (end == value || *end || number < 0 || number > 1000000)
        {
          fprintf(stderr, "%s expects a non-negative integer, got '%s'\n", spelled, value);
          return false;
        }
        *static_cast<int*>(field) = int(number);
      }
      return true;
  }

  return false;
}

// Consumes leading options. On return argv[*first_path..argc) are the paths.
static bool ParseCommandLine(hs::DriverOptions* options, int argc, char** argv, int* first_path)
{
  int i = 1;

  for (; i < argc; ++i)
  {
    const char* arg = argv[i];

    if ('-' != arg[0] || '\0' == arg[1])
      break;

    if (0 == strcmp(arg, "--"))
    {
      ++i;
      break;
    }

    bool        is_long  = '-' == arg[1];
    const char* name     = arg + (is_long ? 2 : 1);
    const char* equals   = is_long ? strchr(name, '=') : nullptr;
    size_t      name_len = equals ? size_t(equals - name) : strlen(name);

    if (!is_long && 1 != name_len)
    {
      fprintf(stderr, "short options can't be combined: %s\n", arg);
      return false;
    }

    const OptionTemplate* templ = FindOption(name, name_len, is_long);
    if (!templ)
    {
      fprintf(stderr, "unrecognized option: %s\n", arg);
      return false;
    }

    const char* value = equals ? equals + 1 : nullptr;

    // Required values may also come from the next argument. The optional
    // repository URI only binds with '=' so it can't swallow a path.
    bool needs_value = OptionType::kInt == templ->m_Type || OptionType::kString == templ->m_Type;
    if (needs_value && !value)
    {
      if (i + 1 >= argc)
      {
        fprintf(stderr, "%s needs a value\n", arg);
        return false;
      }
      value = argv[++i];
    }

    if (!StoreOption(options, templ, arg, value))
      return false;
  }

  *first_path = i;
  return true;
}

static void ShowHelp()
{
  printf("hashsig %s (%s)\n\n", HASHSIG_VERSION_STRING, HASHSIG_PLATFORM_STRING);
  printf("Usage: hashsig [options...] <paths...>\n");
  printf("       hashsig --reference-template [--format=csv|json]\n\n");
  printf("Options:\n");

  for (const OptionTemplate& templ : g_OptionTemplates)
  {
    const char* arg_hint = "";
    switch (templ.m_Type)
    {
      case OptionType::kInt:            arg_hint = " <n>"; break;
      case OptionType::kString:         arg_hint = " <value>"; break;
      case OptionType::kOptionalString: arg_hint = "[=<uri>]"; break;
      case OptionType::kFlag:           break;
    }

    char spelled[64];
    snprintf(spelled, sizeof spelled, "--%s%s", templ.m_LongName, arg_hint);
    printf("  -%c  %-28s %s\n", templ.m_ShortName, spelled, templ.m_Help);
  }

  printf("\nExit status: 0 on success, 1 on setup errors, 2 when interrupted.\n");
}

int main(int argc, char* argv[])
{
  using namespace hs;

  Driver driver;
  DriverOptions options;

  DriverOptionsInit(&options);

  int first_path = 1;
  if (!ParseCommandLine(&options, argc, argv, &first_path))
  {
    ShowHelp();
    return 1;
  }

  const char** paths      = const_cast<const char**>(argv + first_path);
  int          path_count = argc - first_path;

  if (options.m_ShowHelp)
  {
    ShowHelp();
    return 0;
  }

  int log_flags = kWarning | kError;

  if (options.m_Quiet)
    log_flags = kError;

  if (options.m_Verbose)
    log_flags |= kInfo;

  if (options.m_DebugMessages)
    log_flags |= kInfo | kDebug;

  SetLogFlags(log_flags);

  if (0 == path_count && !options.m_ReferenceTemplate)
  {
    fprintf(stderr, "no paths given\n");
    ShowHelp();
    return 1;
  }

  if (!DriverInit(&driver, &options))
  {
    ShowHelp();
    return 1;
  }

  SignalHandlerInit();

  char http_error[256];
  if (!HttpGlobalInit(http_error, sizeof http_error))
  {
    Log(kError, "%s", http_error);
    DriverDestroy(&driver);
    return 1;
  }

  RunResult::Enum result = DriverRun(&driver, paths, path_count);

  if (RunResult::kSetupError != result && !DriverExport(&driver))
    result = RunResult::kSetupError;

  if (options.m_DisplayStats)
    DriverShowStats(&driver);

  if (!options.m_Quiet)
  {
    Log(kInfo, "*** %s (%.2f seconds, %u files)", RunResult::Names[result],
        RunStatsElapsedSeconds(&driver.m_Run.m_Stats), driver.m_Run.m_Stats.m_FilesProcessed);
  }

  DriverDestroy(&driver);
  HttpGlobalShutdown();

  return int(result);
}
