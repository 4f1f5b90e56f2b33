// file      : libforge/ndk/prebuilt.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/ndk/prebuilt.hxx>

#include <cstring> // strlen()

using namespace std;

namespace forge
{
  namespace ndk
  {
    const char module_prefix[] = "ndk_";
    const char object_prefix[] = "ndk_crt";
    const char stl_prefix[]    = "ndk_lib";

    naming_error::
    naming_error (string m, string p)
        : module_error ("NDK prebuilts must have an " + p + " prefixed name",
                        move (m),
                        move (p))
    {
    }

    unknown_stl::
    unknown_stl (string m, string s)
        : module_error ("unknown NDK STL " + s, move (m), move (s))
    {
    }

    // Strip the ndk_ prefix, if present.
    //
    static string
    strip_prefix (const string& m)
    {
      return prefix (m, module_prefix)
        ? string (m, strlen (module_prefix))
        : m;
    }

    dir_path
    prebuilt_lib_dir (const dir_path& root,
                      const toolchain& tc,
                      const string& v)
    {
      const char* s (tc.is_64bit () && !tc.arch ().non_multilib ? "64" : "");

      dir_path r (root);
      r /= "platforms";
      r /= "android-" + v;
      r /= string ("arch-") + tc.name ();
      r /= "usr";
      r /= string ("lib") + s;
      return r;
    }

    path
    prebuilt_module_path (const string& m,
                          const dir_path& root,
                          const toolchain& tc,
                          const string& v,
                          const string& ext)
    {
      // Translate ndk_NAME.EXT.VERSION to NAME<ext>.
      //
      string n (strip_prefix (m));

      size_t p (n.find ('.'));
      if (p != string::npos)
        n.resize (p);

      path r (prebuilt_lib_dir (root, tc, v));
      r /= n + ext;
      return r;
    }

    dir_path
    stl_lib_dir (const string& m,
                 const dir_path& root,
                 const toolchain& tc,
                 const string& stl)
    {
      dir_path d;

      if (stl == "libstlport")
        d = dir_path ("cxx-stl/stlport/libs");
      else if (stl == "libc++")
        d = dir_path ("cxx-stl/llvm-libc++/libs");
      else if (stl == "libgnustl")
      {
        d = dir_path ("cxx-stl/gnu-libstdc++");
        d /= tc.gcc_version ();
        d /= "libs";
      }
      else
        throw unknown_stl (m, stl);

      dir_path r (root);
      r /= "sources";
      r /= d;
      r /= string (tc.arch ().abi);
      return r;
    }

    path
    stl_module_path (const string& m,
                     const dir_path& root,
                     const toolchain& tc,
                     bool a)
    {
      string n (strip_prefix (m));

      for (const char* x: {"_shared", "_static"})
      {
        if (suffix (n, x))
          n.resize (n.size () - strlen (x));
      }

      dir_path d (stl_lib_dir (m, root, tc, n));

      path r (d);
      r /= n + (a ? tc.alib_suffix () : tc.shlib_suffix ());
      return r;
    }
  }
}
