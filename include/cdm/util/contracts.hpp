/// Contracts and Unreachable
///
/// https://github.com/isocpp/CppCoreGuidelines/blob/master/CppCoreGuidelines.md#Ri-expects
///
#pragma once

// Compatibility with non-Clang compilers.
#ifndef __has_builtin
#define __has_builtin(x) 0
#endif

#ifdef CDM_ENABLE_CONTRACTS
#include <stdexcept>

#define CDM_CONTRACTS 1

// http://stackoverflow.com/a/19343239/2679626
#ifndef CDM_STRINGIFY
#define CDM_STRINGIFY_DETAIL(x) #x
#define CDM_STRINGIFY(x) CDM_STRINGIFY_DETAIL(x)
#endif

namespace cdm {

struct broken_contract : std::runtime_error
{
    broken_contract(const char *msg) : std::runtime_error(msg) {}
};

struct unreachable_exception : std::runtime_error
{
    unreachable_exception(const char *msg) : std::runtime_error(msg) {}
};

} // namespace cdm

/// I.6: Prefer Expects() for expressing preconditions.
#define cdm_expects(cond)                                                      \
    ((cond) ? void(0)                                                          \
            : throw ::cdm::broken_contract("precondition failure at " __FILE__ \
                                           ":" CDM_STRINGIFY(__LINE__) ": " #cond))

/// Unreachable code must be marked with this.
#define cdm_unreachable()                                                      \
    (throw ::cdm::unreachable_exception("unreachable code reached at " __FILE__ \
                                        ":" CDM_STRINGIFY(__LINE__)))

#else // ifdef CDM_ENABLE_CONTRACTS

#include <exception>

#define CDM_CONTRACTS 0

#define cdm_expects(cond) void(0)
#if defined(__GNUC__) || __has_builtin(__builtin_unreachable)
#define cdm_unreachable() __builtin_unreachable()
#else
#define cdm_unreachable() std::terminate()
#endif

#endif // ifdef CDM_ENABLE_CONTRACTS
