// file      : libforge/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/utility.hxx>

#include <libbutl/path-io.hxx>

using namespace std;

namespace forge
{
  //
  // <libforge/types.hxx>
  //

  static const char* const run_phase_[] = {"load", "mutate", "link"};

  ostream&
  operator<< (ostream& os, run_phase p)
  {
    return os << run_phase_[static_cast<uint8_t> (p)];
  }

  ostream&
  operator<< (ostream& os, const path& p)
  {
    return butl::to_stream (os, p, true /* representation */);
  }

  //
  // <libforge/utility.hxx>
  //

  // Diagnostics state (verbosity level). Normal verbosity until changed by
  // the host with init_diag().
  //
  uint16_t verb = 1;
  bool silent = false;

  void
  init_diag (uint16_t v, bool s)
  {
    assert (!s || v == 0);

    verb = v;
    silent = s;
  }
}
