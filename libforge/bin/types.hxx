// file      : libforge/bin/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_BIN_TYPES_HXX
#define LIBFORGE_BIN_TYPES_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

namespace forge
{
  namespace bin
  {
    // Library output type (static or shared).
    //
    enum class otype {a, s};

    // Library kinds a module can be built as.
    //
    struct lmembers
    {
      bool a;
      bool s;
    };
  }
}

#endif // LIBFORGE_BIN_TYPES_HXX
