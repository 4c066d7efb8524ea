#pragma once

#if defined(_MSC_VER)
    #define fsl_cpp_version _MSVC_LANG
    #define fsl_signature() __FUNCSIG__
#else
    #define fsl_cpp_version __cplusplus
    #define fsl_signature() __PRETTY_FUNCTION__
#endif

#if defined(_WIN32)
    #define fsl_module __declspec(dllexport)
#elif defined(__GNUC__)
    #define fsl_module __attribute__((visibility("default")))
#else
    #define fsl_module
#endif

#if fsl_cpp_version >= 201703l
    #define fsl_nodiscard [[nodiscard]]
    #define fsl_noreturn [[noreturn]]
#else
    #define fsl_nodiscard
    #define fsl_noreturn
#endif

#if fsl_cpp_version >= 202002l
    #define fsl_likely [[likely]]
    #define fsl_unlikely [[unlikely]]
#else
    #define fsl_likely
    #define fsl_unlikely
#endif

#if defined(__clang__) || defined(__GNUC__)
    #define fsl_likely_if(cnd) if (__builtin_expect(!!(cnd), true))
    #define fsl_unlikely_if(cnd) if (__builtin_expect(!!(cnd), false))
#elif defined(_MSC_VER) && fsl_cpp_version >= 202002l
    #define fsl_likely_if(cnd) if (!!(cnd)) fsl_likely
    #define fsl_unlikely_if(cnd) if (!!(cnd)) fsl_unlikely
#else
    #define fsl_likely_if(cnd) if (cnd)
    #define fsl_unlikely_if(cnd) if (cnd)
#endif

#if defined(fsl_debug)
    #include <cassert>
    #define fsl_assert(expr, msg) assert((expr) && (msg))
#else
    #define fsl_assert(expr, msg) (void)(expr)
#endif

// Unrecoverable misuse, always fatal regardless of fsl_debug.
#define fsl_panic(msg) ::fsl::dtl::panic(msg, fsl_signature())

#if defined(fsl_enable_profiling)
    #include <Tracy.hpp>
    #define fsl_profile_scoped() ZoneScoped
#else
    #define fsl_profile_scoped()
#endif

namespace fsl::dtl {
    fsl_noreturn fsl_module void panic(const char* message, const char* where) noexcept;
} // namespace fsl::dtl
