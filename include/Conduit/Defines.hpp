/// @file Defines.hpp
/// @brief Symbol visibility macros for the Conduit.Base library.
#pragma once

#ifndef CONDUIT_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(CONDUIT_BASE_SHARED_BUILD)
#define CONDUIT_BASE_API __declspec(dllexport)
#elif defined(CONDUIT_BASE_SHARED)
#define CONDUIT_BASE_API __declspec(dllimport)
#else
#define CONDUIT_BASE_API
#endif
#define CONDUIT_BASE_LOCAL
#else
#if defined(CONDUIT_BASE_SHARED_BUILD) || defined(CONDUIT_BASE_SHARED)
#define CONDUIT_BASE_API __attribute__((visibility("default")))
#else
#define CONDUIT_BASE_API
#endif
#define CONDUIT_BASE_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef CONDUIT_BASE_LOCAL
#define CONDUIT_BASE_LOCAL
#endif
