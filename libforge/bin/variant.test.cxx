// file      : libforge/bin/variant.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/graph.hxx>
#include <libforge/module.hxx>
#include <libforge/context.hxx>
#include <libforge/registry.hxx>
#include <libforge/toolchain.hxx>

#include <libforge/bin/init.hxx>
#include <libforge/bin/variant.hxx>
#include <libforge/bin/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace forge
{
  namespace bin
  {
    int
    main (int, char*[])
    {
      registry reg;
      reg.insert (forge_bin_load ());

      assert (reg.find_type ("library"));
      assert (reg.find_type ("library_static"));
      assert (reg.find_type ("library_shared"));
      assert (reg.mutators ().size () == 1 &&
              reg.mutators ()[0].name == "link");

      context ctx (toolchain (arch_type::arm));
      graph g (ctx);

      auto declare = [&reg, &g] (const char* t, const char* n) -> module&
      {
        module& r (g.insert (reg.create (t, n)));
        r.compiler.srcs = {"foo.cpp", "bar.cpp"};
        r.compiler.generated_sources = {"gen.cpp"};
        r.compiler.cflags = {"-O2"};
        return r;
      };

      module& both     (declare ("library",        "libboth"));
      module& astatic  (declare ("library_static", "libstatic"));
      module& ashared  (declare ("library_shared", "libshared"));
      module& flags    (declare ("library",        "libflags"));
      module& sflags   (declare ("library",        "libsflags"));
      module& neither  (declare ("library",        "libneither"));
      module& plain    (declare ("library",        "libplain"));
      module& compiled (declare ("library",        "libcompiled"));
      module& prebuilt (declare ("library",        "libprebuilt"));

      flags.compiler.library->static_cflags = {"-DSTATIC"};
      sflags.compiler.library->shared_cflags = {"-fvisibility=hidden"};

      neither.linker.library->build_static = false;
      neither.linker.library->build_shared = false;

      plain.linker.library = nullopt; // Not a library.

      prebuilt.linker.strategy.mode = link_mode::prebuilt;

      // Variants are only created during the mutate phase.
      //
      ctx.phase = run_phase::mutate;

      // Both kinds: [static, shared].
      //
      {
        size_t n (g.modules ().size ());

        small_vector<module*, 2> vs (expand_variants (g, both));

        assert (vs.size () == 2);
        assert (g.modules ().size () == n + 2);

        module& a (*vs[0]);
        module& s (*vs[1]);

        assert (a.name == "libboth" && s.name == "libboth");
        assert (a.variation == "static" && s.variation == "shared");
        assert (a.group == &both && s.group == &both);
        assert (both.has_variants () && both.variants.size () == 2);
        assert (both.variants[0] == &a && both.variants[1] == &s);

        assert ( a.linker.library->static_ ());
        assert (!s.linker.library->static_ ());
        assert (link_type (*a.linker.library) == otype::a);
        assert (link_type (*s.linker.library) == otype::s);

        assert (g.find ("libboth", "static") == &a);
        assert (g.find ("libboth", "shared") == &s);

        // Each variant has its own copy of the sources.
        //
        assert (a.compiler.srcs == s.compiler.srcs);
        assert (&a.compiler.srcs != &s.compiler.srcs);
        assert (a.compiler.srcs.size () == 2);

        // Identical object code: reuse.
        //
        assert (reuse_objects (g, a, s));

        assert (s.compiler.srcs.empty ());
        assert (s.compiler.generated_sources.empty ());
        assert (a.compiler.srcs.size () == 2);
        assert (a.compiler.generated_sources.size () == 1);

        const dependency* d (s.find_dependency (dependency_tag::reuse_objects));
        assert (d != nullptr && d->target == &a);
        assert (a.dependencies.empty ());
      }

      // Single kind.
      //
      {
        small_vector<module*, 2> vs (expand_variants (g, astatic));
        assert (vs.size () == 1);
        assert (vs[0]->variation == "static");
        assert (vs[0]->linker.library->static_ ());

        vs = expand_variants (g, ashared);
        assert (vs.size () == 1);
        assert (vs[0]->variation == "shared");
        assert (!vs[0]->linker.library->static_ ());
      }

      // Kind-specific flags: no reuse, no mutation.
      //
      {
        small_vector<module*, 2> vs (expand_variants (g, flags));
        assert (!reuse_objects (g, *vs[0], *vs[1]));
        assert (vs[1]->dependencies.empty ());
        assert (vs[1]->compiler.srcs.size () == 2);
        assert (vs[1]->compiler.generated_sources.size () == 1);

        vs = expand_variants (g, sflags);
        assert (!reuse_objects (g, *vs[0], *vs[1]));
        assert (vs[0]->dependencies.empty () && vs[1]->dependencies.empty ());
        assert (vs[1]->compiler.srcs.size () == 2);
      }

      // Neither kind: nothing is created.
      //
      {
        size_t n (g.modules ().size ());

        try
        {
          expand_variants (g, neither);
          assert (false);
        }
        catch (const configuration_error& e)
        {
          assert (e.module == "libneither");
          assert (e.value.empty ());
          assert (string (e.what ()).find ("libneither") == string::npos);
        }

        assert (g.modules ().size () == n);
        assert (!neither.has_variants ());
        assert (g.find ("libneither", "static") == nullptr);
      }

      // The mutator leaves modules that are not libraries alone.
      //
      {
        size_t n (g.modules ().size ());

        link_mutator (g, plain);

        assert (g.modules ().size () == n);
        assert (!plain.has_variants ());
      }

      // The mutator reuses objects of compiled libraries only.
      //
      {
        link_mutator (g, compiled);

        assert (compiled.variants.size () == 2);
        assert (compiled.variants[1]->find_dependency (
                  dependency_tag::reuse_objects) != nullptr);

        link_mutator (g, prebuilt);

        assert (prebuilt.variants.size () == 2);
        assert (prebuilt.variants[1]->dependencies.empty ());
        assert (prebuilt.variants[1]->compiler.srcs.size () == 2);
      }

      return 0;
    }
  }
}

int
main (int argc, char* argv[])
{
  return forge::bin::main (argc, argv);
}
