// file      : libforge/context.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/context.hxx>

#include <libforge/diagnostics.hxx>

using namespace std;

namespace forge
{
  context::
  context (forge::toolchain t, dir_path r, string v)
      : ndk_root (move (r)),
        sdk_version (move (v)),
        toolchain (move (t))
  {
  }

  void context::
  configure (const strings& vars)
  {
    tracer trace ("context::configure");

    if (phase != run_phase::load)
      fail << "configuration override during " << phase << " phase";

    for (const string& s: vars)
    {
      size_t p (s.find ('='));

      if (p == string::npos)
        fail << "invalid configuration override '" << s << "'" <<
          info << "expected <variable>=<value>";

      string n (s, 0, p);
      string v (s, p + 1);

      trim (n);
      trim (v);

      if (n == "config.ndk.root")
      {
        if (v.empty ())
          fail << "empty value for " << n;

        try
        {
          ndk_root = dir_path (v);
        }
        catch (const invalid_path& e)
        {
          fail << "invalid " << n << " value '" << e.path << "'";
        }
      }
      else if (n == "config.ndk.sdk_version")
      {
        if (v.empty ())
          fail << "empty value for " << n;

        sdk_version = move (v);
      }
      else if (n == "config.ndk.arch")
      {
        const arch_info* a (lookup_arch (v));

        if (a == nullptr)
          fail << "unknown architecture '" << v << "' in " << n <<
            info << "expected arm, arm64, mips, mips64, x86, or x86_64";

        toolchain = forge::toolchain (a->type,
                                      toolchain.gcc_version (),
                                      toolchain.shlib_suffix (),
                                      toolchain.alib_suffix ());
      }
      else if (n == "config.ndk.gcc_version")
      {
        if (v.empty ())
          fail << "empty value for " << n;

        toolchain = forge::toolchain (toolchain.arch ().type,
                                      move (v),
                                      toolchain.shlib_suffix (),
                                      toolchain.alib_suffix ());
      }
      else
        fail << "unknown configuration variable " << n;

      l5 ([&]{trace << n << " set from override";});
    }
  }
}
