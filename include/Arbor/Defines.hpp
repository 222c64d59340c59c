/// @file Defines.hpp
/// @brief Symbol export and compiler helpers.
#pragma once

// ARBOR_SHARED_BUILD is set while building the shared library, ARBOR_SHARED when consuming it.
#ifndef ARBOR_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(ARBOR_SHARED_BUILD)
#define ARBOR_API __declspec(dllexport)
#elif defined(ARBOR_SHARED)
#define ARBOR_API __declspec(dllimport)
#else
#define ARBOR_API
#endif
#elif defined(ARBOR_SHARED_BUILD) || defined(ARBOR_SHARED)
#define ARBOR_API __attribute__((visibility("default")))
#else
#define ARBOR_API
#endif
#endif

namespace Arbor
{
    [[noreturn]] inline void Unreachable()
    {
#if defined(_MSC_VER) && !defined(__clang__)
        __assume(false);
#else
        __builtin_unreachable();
#endif
    }
}// namespace Arbor
