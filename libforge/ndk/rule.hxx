// file      : libforge/ndk/rule.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_NDK_RULE_HXX
#define LIBFORGE_NDK_RULE_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/module.hxx>
#include <libforge/context.hxx>

#include <libforge/export.hxx>

namespace forge
{
  namespace ndk
  {
    // Link step of the NDK prebuilt modules. These are null build steps that
    // only set up the output path (see prebuilt_resolve_function).
    //
    // NDK prebuilts differ from regular prebuilts in that they aren't
    // stripped and usually aren't installed either (with the exception of
    // the shared STLs, which are installed to the app's directory rather
    // than to the system image).

    // Prebuilt object file (crtbegin, etc). The module name must have the
    // ndk_crt prefix.
    //
    LIBFORGE_SYMEXPORT path
    link_object (const context&, module&);

    // Prebuilt platform library. Exports its include directories as system
    // ones.
    //
    LIBFORGE_SYMEXPORT path
    link_library (const context&, module&);

    // Prebuilt STL. The module name must have the ndk_lib prefix. Exports its
    // include directories as regular ones.
    //
    LIBFORGE_SYMEXPORT path
    link_stl (const context&, module&);
  }
}

#endif // LIBFORGE_NDK_RULE_HXX
