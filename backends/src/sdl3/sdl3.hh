#pragma once

#include <afqueue/sdk/compiler.hh>

#if defined(AFQUEUE_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(AFQUEUE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AFQUEUE_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif

#include <SDL3/SDL.h>

#if defined(AFQUEUE_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(AFQUEUE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AFQUEUE_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif
