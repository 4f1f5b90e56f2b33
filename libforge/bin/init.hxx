// file      : libforge/bin/init.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_BIN_INIT_HXX
#define LIBFORGE_BIN_INIT_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/registry.hxx>

#include <libforge/export.hxx>

namespace forge
{
  namespace bin
  {
    // Module types:
    //
    // `library`         -- compiled library built both static and shared.
    // `library_static`  -- compiled static library.
    // `library_shared`  -- compiled shared library.
    //
    // Mutators:
    //
    // `link`            -- splits libraries into static/shared variants.
    //
    extern "C" LIBFORGE_SYMEXPORT const module_functions*
    forge_bin_load ();
  }
}

#endif // LIBFORGE_BIN_INIT_HXX
