// file      : libforge/ndk/prebuilt.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_NDK_PREBUILT_HXX
#define LIBFORGE_NDK_PREBUILT_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/module.hxx>
#include <libforge/toolchain.hxx>

#include <libforge/export.hxx>

namespace forge
{
  namespace ndk
  {
    // NDK prebuilt module names are decorated with this prefix to keep them
    // apart from the modules built from source.
    //
    LIBFORGE_SYMEXPORT extern const char module_prefix[]; // ndk_
    LIBFORGE_SYMEXPORT extern const char object_prefix[]; // ndk_crt
    LIBFORGE_SYMEXPORT extern const char stl_prefix[];    // ndk_lib

    // Module name does not have the prefix required for its category. The
    // value is the expected prefix.
    //
    struct LIBFORGE_SYMEXPORT naming_error: module_error
    {
      naming_error (string module, string prefix);
    };

    // STL flavor is not one of libstlport, libc++, or libgnustl. The value
    // is the flavor.
    //
    struct LIBFORGE_SYMEXPORT unknown_stl: module_error
    {
      unknown_stl (string module, string stl);
    };

    // Directory of the platform libraries:
    //
    // <root>/platforms/android-<version>/arch-<toolchain>/usr/lib[64]
    //
    // The 64 suffix is used for 64-bit toolchains except for architectures
    // that are not multilib (see arch_info::non_multilib).
    //
    LIBFORGE_SYMEXPORT dir_path
    prebuilt_lib_dir (const dir_path& root,
                      const toolchain&,
                      const string& version);

    // Path of a platform prebuilt. Prebuilts are named like
    // ndk_NAME.EXT.VERSION (the .EXT.VERSION part is optional) and the
    // resulting file is NAME<ext>.
    //
    // The module name is expected to have been checked for the ndk_ prefix
    // by the caller.
    //
    LIBFORGE_SYMEXPORT path
    prebuilt_module_path (const string& module,
                          const dir_path& root,
                          const toolchain&,
                          const string& version,
                          const string& ext);

    // Directory of the STL libraries:
    //
    // libstlport  <root>/sources/cxx-stl/stlport/libs/<abi>
    // libc++      <root>/sources/cxx-stl/llvm-libc++/libs/<abi>
    // libgnustl   <root>/sources/cxx-stl/gnu-libstdc++/<gcc>/libs/<abi>
    //
    // Unlike the platform libraries, STLs are not specific to the platform
    // version. Throw unknown_stl for any other flavor.
    //
    LIBFORGE_SYMEXPORT dir_path
    stl_lib_dir (const string& module,
                 const dir_path& root,
                 const toolchain&,
                 const string& stl);

    // Path of an STL prebuilt named like ndk_<stl>[_shared|_static]. The
    // resulting file is <stl> followed by the static library suffix if
    // static is true and by the shared library suffix otherwise.
    //
    LIBFORGE_SYMEXPORT path
    stl_module_path (const string& module,
                     const dir_path& root,
                     const toolchain&,
                     bool static_);
  }
}

#endif // LIBFORGE_NDK_PREBUILT_HXX
