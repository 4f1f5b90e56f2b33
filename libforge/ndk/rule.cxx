// file      : libforge/ndk/rule.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/ndk/rule.hxx>

#include <libforge/diagnostics.hxx>

#include <libforge/ndk/prebuilt.hxx>

using namespace std;

namespace forge
{
  namespace ndk
  {
    static const string object_extension (".o");

    static inline const string&
    sdk_version (const context& ctx, const module& m)
    {
      return m.sdk_version ? *m.sdk_version : ctx.sdk_version;
    }

    static void
    export_includes (module& m, const char* opt)
    {
      strings& fs (m.linker.exported_flags);
      fs.clear ();

      for (const dir_path& d: m.linker.export_include_dirs)
      {
        fs.push_back (opt);
        fs.push_back (d.string ());
      }
    }

    path
    link_object (const context& ctx, module& m)
    {
      tracer trace ("ndk::link_object");

      if (!prefix (m.name, object_prefix))
        throw naming_error (m.name, object_prefix);

      path r (prebuilt_module_path (m.name,
                                    ctx.ndk_root,
                                    ctx.toolchain,
                                    sdk_version (ctx, m),
                                    object_extension));

      l5 ([&]{trace << m << " -> " << r;});
      return r;
    }

    path
    link_library (const context& ctx, module& m)
    {
      tracer trace ("ndk::link_library");

      if (!prefix (m.name, module_prefix))
        throw naming_error (m.name, module_prefix);

      export_includes (m, "-isystem");

      path r (prebuilt_module_path (m.name,
                                    ctx.ndk_root,
                                    ctx.toolchain,
                                    sdk_version (ctx, m),
                                    ctx.toolchain.shlib_suffix ()));

      l5 ([&]{trace << m << " -> " << r;});
      return r;
    }

    path
    link_stl (const context& ctx, module& m)
    {
      tracer trace ("ndk::link_stl");

      if (!prefix (m.name, stl_prefix))
        throw naming_error (m.name, stl_prefix);

      assert (m.linker.library);

      export_includes (m, "-I");

      path r (stl_module_path (m.name,
                               ctx.ndk_root,
                               ctx.toolchain,
                               m.linker.library->static_ ()));

      l5 ([&]{trace << m << " -> " << r;});
      return r;
    }
  }
}
