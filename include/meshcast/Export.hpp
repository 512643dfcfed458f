#pragma once

#if defined(_WIN32)
#  if defined(MESHCAST_BUILD_SHARED)
#    if defined(meshcast_core_EXPORTS)
#      define MESHCAST_API __declspec(dllexport)
#    else
#      define MESHCAST_API __declspec(dllimport)
#    endif
#  else
#    define MESHCAST_API
#  endif
#else
#  if defined(MESHCAST_BUILD_SHARED)
#    define MESHCAST_API __attribute__((visibility("default")))
#  else
#    define MESHCAST_API
#  endif
#endif
