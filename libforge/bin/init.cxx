// file      : libforge/bin/init.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/bin/init.hxx>

#include <libforge/module.hxx>

#include <libforge/bin/variant.hxx>

using namespace std;

namespace forge
{
  namespace bin
  {
    static unique_ptr<module>
    new_library (string n, const char* t, bool a, bool s)
    {
      unique_ptr<module> r (new module (move (n), t));

      r->compiler.library = library_compiler ();

      library_linker l;
      l.build_static = a;
      l.build_shared = s;
      r->linker.library = l;

      return r;
    }

    static unique_ptr<module>
    library_factory (string n)
    {
      return new_library (move (n), "library", true, true);
    }

    static unique_ptr<module>
    library_static_factory (string n)
    {
      return new_library (move (n), "library_static", true, false);
    }

    static unique_ptr<module>
    library_shared_factory (string n)
    {
      return new_library (move (n), "library_shared", false, true);
    }

    static const module_functions mod_functions[] =
    {
      {"library",        &library_factory,        nullptr},
      {"library_static", &library_static_factory, nullptr},
      {"library_shared", &library_shared_factory, nullptr},
      {"link",           nullptr,                 &link_mutator},
      {nullptr,          nullptr,                 nullptr}
    };

    const module_functions*
    forge_bin_load ()
    {
      return mod_functions;
    }
  }
}
