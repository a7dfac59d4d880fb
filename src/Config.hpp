#ifndef CONFIG_HPP
#define CONFIG_HPP

// Feature switches are YES or NO; testing one that was never defined is a
// compile error instead of a silent "no".
#define YES      -1
#define NO       -2
#define ENABLED(feature)  (1 == 2 feature)
#define DISABLED(feature)  (0 == 2 feature)

#if defined(_DEBUG)
#define CHECKED_BUILD YES
#else
#define CHECKED_BUILD NO
#endif

#if !defined(__GNUC__)
#error hashsig builds with GCC or Clang
#endif

#define NORETURN __attribute__((noreturn))
#define ALIGNOF(t) __alignof(t)

#if defined(__linux__)
#define HASHSIG_PLATFORM_STRING "linux"
#elif defined(__APPLE__)
#define HASHSIG_PLATFORM_STRING "macosx"
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define HASHSIG_PLATFORM_STRING "bsd"
#else
#error Unsupported OS
#endif

#define HASHSIG_VERSION_STRING "1.0.0"

#define HS_PATHSEP     '/'
#define HS_PATHSEP_STR "/"

// Repository endpoint queried when no URI is given on the command line.
#define HASHSIG_DEFAULT_REPOSITORY_URI "https://validate.whitescope.io/api/v1/json/"

// Placeholder rendered for match results with nothing to compare against.
#define HASHSIG_DEFAULT_MISSING_PLACEHOLDER "N/A"

#endif
