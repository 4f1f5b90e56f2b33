// file      : libforge/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_UTILITY_HXX
#define LIBFORGE_UTILITY_HXX

#include <memory>      // make_shared()
#include <string>      // to_string()
#include <utility>     // move(), forward(), make_pair(), swap()
#include <cassert>     // assert()
#include <algorithm>   // *
#include <functional>  // ref(), cref()

#include <libbutl/utility.hxx>  // trim(), etc

#include <libforge/types.hxx>

#include <libforge/export.hxx>

namespace forge
{
  using std::move;
  using std::swap;
  using std::forward;

  using std::ref;
  using std::cref;

  using std::make_pair;
  using std::make_shared;

  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::trim;

  // Return true if the string begins/ends with the specified prefix/suffix.
  //
  inline bool
  prefix (const string& s, const char* p)
  {
    return s.compare (0, string::traits_type::length (p), p) == 0;
  }

  inline bool
  suffix (const string& s, const char* x)
  {
    size_t n (string::traits_type::length (x));
    return s.size () >= n && s.compare (s.size () - n, n, x) == 0;
  }

  // Diagnostics state (verbosity level, etc; see <libforge/diagnostics.hxx>).
  //
  // Initialize the diagnostics state. Should be called once early in main().
  // Default values are for unit tests.
  //
  // If silent is true, verbosity should be 0.
  //
  LIBFORGE_SYMEXPORT void
  init_diag (uint16_t verbosity, bool silent = false);

  const uint16_t verb_never = 7;
  LIBFORGE_SYMEXPORT extern uint16_t verb;
  LIBFORGE_SYMEXPORT extern bool silent;
}

#endif // LIBFORGE_UTILITY_HXX
