// file      : libforge/context.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_CONTEXT_HXX
#define LIBFORGE_CONTEXT_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/toolchain.hxx>

#include <libforge/export.hxx>

namespace forge
{
  // Graph generation context: the configuration the passes are run with
  // and the current phase.
  //
  class LIBFORGE_SYMEXPORT context
  {
  public:
    // Root of the NDK prebuilts. Relative paths are relative to the source
    // root of the build.
    //
    dir_path ndk_root;

    // Default platform (SDK) version for modules that don't specify one.
    //
    string sdk_version;

    // Target toolchain.
    //
    forge::toolchain toolchain;

    run_phase phase = run_phase::load;

    explicit
    context (forge::toolchain,
             dir_path ndk_root = dir_path ("prebuilts/ndk/current"),
             string sdk_version = "current");

    // Apply configuration overrides in the <variable>=<value> form. The
    // recognized variables are:
    //
    // config.ndk.root         NDK prebuilts root directory
    // config.ndk.sdk_version  default platform version
    // config.ndk.arch         target architecture (arm, arm64, x86, ...)
    // config.ndk.gcc_version  toolchain GCC version
    //
    // Issue diagnostics and throw failed on unknown variables or invalid
    // values. Can only be called during the load phase.
    //
    void
    configure (const strings&);
  };
}

#endif // LIBFORGE_CONTEXT_HXX
