// file      : libforge/toolchain.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/toolchain.hxx>

using namespace std;

namespace forge
{
  // Note: ordered as arch_type.
  //
  static const arch_info arch_table[] = {
    {arch_type::arm,    "arm",    "armeabi-v7a", 32, false},
    {arch_type::arm64,  "arm64",  "arm64-v8a",   64, true },
    {arch_type::mips,   "mips",   "mips",        32, false},
    {arch_type::mips64, "mips64", "mips64",      64, false},
    {arch_type::x86,    "x86",    "x86",         32, false},
    {arch_type::x86_64, "x86_64", "x86_64",      64, false}};

  const arch_info&
  lookup_arch (arch_type t)
  {
    const arch_info& r (arch_table[static_cast<size_t> (t)]);
    assert (r.type == t);
    return r;
  }

  const arch_info*
  lookup_arch (const string& n)
  {
    for (const arch_info& a: arch_table)
    {
      if (n == a.name)
        return &a;
    }

    return nullptr;
  }

  ostream&
  operator<< (ostream& os, arch_type t)
  {
    return os << lookup_arch (t).name;
  }

  toolchain::
  toolchain (arch_type t, string gv, string ss, string as)
      : arch_ (&lookup_arch (t)),
        gcc_version_ (move (gv)),
        shlib_suffix_ (move (ss)),
        alib_suffix_ (move (as))
  {
  }
}
