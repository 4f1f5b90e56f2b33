// file      : libforge/ndk/init.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/ndk/init.hxx>

#include <libforge/module.hxx>

#include <libforge/ndk/rule.hxx>

using namespace std;

namespace forge
{
  namespace ndk
  {
    static unique_ptr<module>
    new_prebuilt (string n, const char* t, prebuilt_resolve_function* f)
    {
      unique_ptr<module> r (new module (move (n), t));

      r->linker.strategy.mode = link_mode::prebuilt;
      r->linker.strategy.resolve = f;
      r->hide_from_make = true;

      return r;
    }

    static unique_ptr<module>
    new_prebuilt_library (string n,
                          const char* t,
                          prebuilt_resolve_function* f,
                          bool a)
    {
      unique_ptr<module> r (new_prebuilt (move (n), t, f));

      library_linker l;
      l.build_static = a;
      l.build_shared = !a;
      r->linker.library = l;

      return r;
    }

    static unique_ptr<module>
    prebuilt_library_factory (string n)
    {
      return new_prebuilt_library (
        move (n), "ndk_prebuilt_library", &link_library, false);
    }

    static unique_ptr<module>
    prebuilt_object_factory (string n)
    {
      return new_prebuilt (move (n), "ndk_prebuilt_object", &link_object);
    }

    static unique_ptr<module>
    prebuilt_static_stl_factory (string n)
    {
      return new_prebuilt_library (
        move (n), "ndk_prebuilt_static_stl", &link_stl, true);
    }

    static unique_ptr<module>
    prebuilt_shared_stl_factory (string n)
    {
      unique_ptr<module> r (
        new_prebuilt_library (
          move (n), "ndk_prebuilt_shared_stl", &link_stl, false));

      r->install = true;
      return r;
    }

    static const module_functions mod_functions[] =
    {
      {"ndk_prebuilt_library",    &prebuilt_library_factory,    nullptr},
      {"ndk_prebuilt_object",     &prebuilt_object_factory,     nullptr},
      {"ndk_prebuilt_static_stl", &prebuilt_static_stl_factory, nullptr},
      {"ndk_prebuilt_shared_stl", &prebuilt_shared_stl_factory, nullptr},
      {nullptr,                   nullptr,                      nullptr}
    };

    const module_functions*
    forge_ndk_load ()
    {
      return mod_functions;
    }
  }
}
