// file      : libforge/bin/variant.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/bin/variant.hxx>

#include <libforge/diagnostics.hxx>

#include <libforge/bin/utility.hxx>

using namespace std;

namespace forge
{
  namespace bin
  {
    configuration_error::
    configuration_error (string m)
        : module_error ("library is neither static nor shared",
                        move (m))
    {
    }

    small_vector<module*, 2>
    expand_variants (graph& g, module& m)
    {
      tracer trace ("bin::expand_variants");

      lmembers lm (link_members (m));

      // Verify before creating anything so that a failed module does not
      // leave variants behind.
      //
      if (!lm.a && !lm.s)
        throw configuration_error (m.name);

      small_vector<module*, 2> r;

      if (lm.a && lm.s)
        r = g.create_variants (m, {variation (otype::a), variation (otype::s)});
      else if (lm.a)
        r = g.create_variants (m, {variation (otype::a)});
      else
        r = g.create_variants (m, {variation (otype::s)});

      // Each variant is exactly one kind.
      //
      for (module* v: r)
        v->linker.library->set_static (v->variation == variation (otype::a));

      l5 ([&]{
          diag_record dr (trace);
          dr << m << " ->";
          for (const module* v: r)
            dr << ' ' << *v;
        });

      return r;
    }

    bool
    reuse_objects (graph& g, module& a, module& s)
    {
      tracer trace ("bin::reuse_objects");

      assert (a.group != nullptr && a.group == s.group);
      assert (link_type (*a.linker.library) == otype::a &&
              link_type (*s.linker.library) == otype::s);

      const optional<library_compiler>& ac (a.compiler.library);
      const optional<library_compiler>& sc (s.compiler.library);

      if (!ac || !sc)
        return false;

      if (!ac->static_cflags.empty () || !sc->shared_cflags.empty ())
      {
        l4 ([&]{trace << "not reusing " << a << " objects for " << s
                      << ": kind-specific compile flags";});
        return false;
      }

      g.add_dependency (s, a, dependency_tag::reuse_objects);

      s.compiler.srcs.clear ();
      s.compiler.generated_sources.clear ();

      l5 ([&]{trace << "reusing " << a << " objects for " << s;});
      return true;
    }

    void
    link_mutator (graph& g, module& m)
    {
      if (!m.linker.library)
        return;

      small_vector<module*, 2> vs (expand_variants (g, m));

      // Prebuilt modules have nothing to compile.
      //
      if (vs.size () == 2 && m.linker.strategy.mode == link_mode::compiled)
        reuse_objects (g, *vs[0], *vs[1]);
    }
  }
}
