// file      : libforge/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace forge
{
  // Diagnostic facility, project specifics.
  //

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << type_ << ": ";

    if (mod_ != nullptr)
      r << mod_ << "::";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr, nullptr); // No type/frame.
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
