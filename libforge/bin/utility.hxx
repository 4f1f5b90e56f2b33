// file      : libforge/bin/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_BIN_UTILITY_HXX
#define LIBFORGE_BIN_UTILITY_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/module.hxx>

#include <libforge/bin/types.hxx>

namespace forge
{
  namespace bin
  {
    // Variation name of a library variant ("static" or "shared").
    //
    const char*
    variation (otype);

    // Library output type of a variant.
    //
    otype
    link_type (const library_linker&);

    // Library kinds the module declares. Both are false for a module that
    // does not produce a library.
    //
    lmembers
    link_members (const module&);
  }
}

#include <libforge/bin/utility.ixx>

#endif // LIBFORGE_BIN_UTILITY_HXX
