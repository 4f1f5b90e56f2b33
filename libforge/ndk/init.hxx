// file      : libforge/ndk/init.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_NDK_INIT_HXX
#define LIBFORGE_NDK_INIT_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/registry.hxx>

#include <libforge/export.hxx>

namespace forge
{
  namespace ndk
  {
    // Module types:
    //
    // `ndk_prebuilt_library`     -- platform shared library (ndk_libfoo.so.21).
    // `ndk_prebuilt_object`      -- platform object file (ndk_crtbegin_so.o.21).
    // `ndk_prebuilt_static_stl`  -- static STL (ndk_libc++_static).
    // `ndk_prebuilt_shared_stl`  -- shared STL (ndk_libc++_shared).
    //
    // All of them use the prebuilt link strategy and are hidden from make.
    // The library and STL types still go through the link mutator and end
    // up with a single variant of their kind.
    //
    extern "C" LIBFORGE_SYMEXPORT const module_functions*
    forge_ndk_load ();
  }
}

#endif // LIBFORGE_NDK_INIT_HXX
