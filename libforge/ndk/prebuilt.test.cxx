// file      : libforge/ndk/prebuilt.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/toolchain.hxx>

#include <libforge/ndk/prebuilt.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace forge
{
  namespace ndk
  {
    int
    main (int, char*[])
    {
      const dir_path root ("prebuilts/ndk/current");

      // Platform library directory.
      //
      {
        auto ld = [&root] (arch_type a, const char* v)
        {
          return prebuilt_lib_dir (root, toolchain (a), v);
        };

        assert (ld (arch_type::x86_64, "24") ==
                dir_path ("prebuilts/ndk/current/platforms/android-24/"
                          "arch-x86_64/usr/lib64"));

        assert (ld (arch_type::mips64, "21") ==
                dir_path ("prebuilts/ndk/current/platforms/android-21/"
                          "arch-mips64/usr/lib64"));

        // The 64-bit architecture that is not multilib.
        //
        assert (ld (arch_type::arm64, "21") ==
                dir_path ("prebuilts/ndk/current/platforms/android-21/"
                          "arch-arm64/usr/lib"));

        assert (ld (arch_type::arm, "9") ==
                dir_path ("prebuilts/ndk/current/platforms/android-9/"
                          "arch-arm/usr/lib"));

        assert (ld (arch_type::x86, "current") ==
                dir_path ("prebuilts/ndk/current/platforms/android-current/"
                          "arch-x86/usr/lib"));

        // Only arm64 is exempt.
        //
        for (arch_type a: {arch_type::arm,  arch_type::arm64,
                           arch_type::mips, arch_type::mips64,
                           arch_type::x86,  arch_type::x86_64})
        {
          const arch_info& i (lookup_arch (a));
          assert (i.non_multilib == (a == arch_type::arm64));
        }
      }

      // Platform module path.
      //
      {
        toolchain x86_64 (arch_type::x86_64);
        toolchain arm64 (arch_type::arm64);

        path p (prebuilt_module_path (
                  "ndk_libfoo.so.24", root, x86_64, "24", ".so"));

        assert (p == path ("prebuilts/ndk/current/platforms/android-24/"
                           "arch-x86_64/usr/lib64/libfoo.so"));
        assert (p.leaf ().string () == "libfoo.so");

        p = prebuilt_module_path ("ndk_libfoo.so.21", root, arm64, "21", ".so");

        assert (p == path ("prebuilts/ndk/current/platforms/android-21/"
                           "arch-arm64/usr/lib/libfoo.so"));

        // No embedded version.
        //
        p = prebuilt_module_path ("ndk_libm", root, arm64, "21", ".so");
        assert (p.leaf ().string () == "libm.so");

        // Object with a different extension.
        //
        p = prebuilt_module_path (
          "ndk_crtbegin_so.o.21", root, x86_64, "21", ".o");
        assert (p.leaf ().string () == "crtbegin_so.o");

        // Custom root.
        //
        p = prebuilt_module_path (
          "ndk_libc.so", dir_path ("/opt/ndk"), x86_64, "23", ".so");
        assert (p.directory () ==
                dir_path ("/opt/ndk/platforms/android-23/arch-x86_64/usr/lib64"));
      }

      // STL directory.
      //
      {
        toolchain arm (arch_type::arm, "4.9");
        toolchain arm64 (arch_type::arm64, "4.8");

        assert (stl_lib_dir ("ndk_libc++_shared", root, arm, "libc++") ==
                dir_path ("prebuilts/ndk/current/sources/cxx-stl/llvm-libc++/"
                          "libs/armeabi-v7a"));

        assert (stl_lib_dir ("ndk_libstlport_static", root, arm64, "libstlport") ==
                dir_path ("prebuilts/ndk/current/sources/cxx-stl/stlport/"
                          "libs/arm64-v8a"));

        // The GCC version is part of the libgnustl layout.
        //
        assert (stl_lib_dir ("ndk_libgnustl_shared", root, arm64, "libgnustl") ==
                dir_path ("prebuilts/ndk/current/sources/cxx-stl/gnu-libstdc++/"
                          "4.8/libs/arm64-v8a"));

        try
        {
          stl_lib_dir ("ndk_libfoo++_shared", root, arm, "libfoo++");
          assert (false);
        }
        catch (const unknown_stl& e)
        {
          assert (e.module == "ndk_libfoo++_shared");
          assert (e.value == "libfoo++");
        }
      }

      // STL module path.
      //
      {
        toolchain x86 (arch_type::x86);
        toolchain x86_64 (arch_type::x86_64, "4.9", ".so", ".a");

        path p (stl_module_path ("ndk_libc++_shared", root, x86, false));

        assert (p.directory () ==
                dir_path ("prebuilts/ndk/current/sources/cxx-stl/llvm-libc++/"
                          "libs/x86"));
        assert (p.leaf ().string () == "libc++" + x86.shlib_suffix ());

        p = stl_module_path ("ndk_libc++_static", root, x86_64, true);
        assert (p.leaf ().string () == "libc++.a");

        p = stl_module_path ("ndk_libgnustl_static", root, x86_64, true);
        assert (p == path ("prebuilts/ndk/current/sources/cxx-stl/"
                           "gnu-libstdc++/4.9/libs/x86_64/libgnustl.a"));

        // Both kind suffixes are stripped, shared first.
        //
        p = stl_module_path ("ndk_libc++_static_shared", root, x86, true);
        assert (p == path ("prebuilts/ndk/current/sources/cxx-stl/"
                           "llvm-libc++/libs/x86/libc++.a"));

        // No kind suffix.
        //
        p = stl_module_path ("ndk_libstlport", root, x86, false);
        assert (p.leaf ().string () == "libstlport.so");

        // Unknown flavor: no path.
        //
        try
        {
          p = stl_module_path ("ndk_libfoo++", root, x86, false);
          assert (false);
        }
        catch (const unknown_stl& e)
        {
          assert (e.module == "ndk_libfoo++");
          assert (e.value == "libfoo++");
        }

        assert (p.leaf ().string () == "libstlport.so");
      }

      return 0;
    }
  }
}

int
main (int argc, char* argv[])
{
  return forge::ndk::main (argc, argv);
}
