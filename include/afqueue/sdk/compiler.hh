/**
 * @file compiler.hh
 * @brief Compiler detection macros
 */
#pragma once

#if defined(__clang__)
#define AFQUEUE_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define AFQUEUE_COMPILER_GCC
#elif defined(_MSC_VER)
#define AFQUEUE_COMPILER_MSVC
#endif
