// file      : libforge/graph.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/graph.hxx>

#include <libforge/diagnostics.hxx>

using namespace std;

namespace forge
{
  // Issue module_error diagnostics.
  //
  static void
  diag_module_error (const module_error& e)
  {
    diag_record dr (error);
    dr << "module " << e.module << ": " << e.what ();

    if (!e.value.empty ())
      dr << info << "offending value: " << e.value;
  }

  module& graph::
  insert (unique_ptr<module> m)
  {
    if (ctx.phase != run_phase::load)
      fail << "module " << *m << " declared during " << ctx.phase
           << " phase";

    if (find (m->name) != nullptr)
      fail << "module " << m->name << " already declared";

    modules_.push_back (move (m));
    return *modules_.back ();
  }

  module* graph::
  find (const string& n, const string& v)
  {
    for (const unique_ptr<module>& m: modules_)
    {
      if (m->name == n && m->variation == v)
        return m.get ();
    }

    return nullptr;
  }

  small_vector<module*, 2> graph::
  create_variants (module& m, initializer_list<const char*> ns)
  {
    tracer trace ("graph::create_variants");

    if (ctx.phase != run_phase::mutate)
      fail << "variants of " << m << " created during " << ctx.phase
           << " phase";

    // Variants of variants are not supported.
    //
    if (m.group != nullptr || m.has_variants ())
      fail << "module " << m << " is already split into variants";

    small_vector<module*, 2> r;

    for (const char* n: ns)
    {
      unique_ptr<module> v (new module (m));
      v->variation = n;
      v->group = &m;

      l6 ([&]{trace << "variant " << *v;});

      modules_.push_back (move (v));
      r.push_back (modules_.back ().get ());
    }

    m.variants = r;
    return r;
  }

  void graph::
  add_dependency (module& f, const module& t, dependency_tag tag)
  {
    tracer trace ("graph::add_dependency");

    assert (&f != &t);

    l6 ([&]{trace << f << " -> " << t << " (" << tag << ")";});

    f.dependencies.push_back (dependency {tag, &t});
  }

  void graph::
  mutate (const registry& reg)
  {
    tracer trace ("graph::mutate");

    if (ctx.phase != run_phase::load)
      fail << "mutate phase already run";

    ctx.phase = run_phase::mutate;

    // Only visit the modules declared during load: variants are appended to
    // modules_ by the mutators and must not be mutated again.
    //
    vector<module*> ms;
    ms.reserve (modules_.size ());
    for (const unique_ptr<module>& m: modules_)
      ms.push_back (m.get ());

    size_t errors (0);

    for (const registry::mutator_entry& e: reg.mutators ())
    {
      l5 ([&]{trace << "running " << e.name << " mutator";});

      for (module* m: ms)
      {
        if (m->failed)
          continue;

        try
        {
          e.function (*this, *m);
        }
        catch (const module_error& x)
        {
          diag_module_error (x);
          m->failed = true;
          ++errors;
        }
      }
    }

    // This is the barrier: from now on the graph structure is final.
    //
    ctx.phase = run_phase::link;

    if (errors != 0)
    {
      l4 ([&]{trace << errors << " module(s) failed to mutate";});
      throw failed ();
    }
  }

  const path* graph::
  link (module& m)
  {
    tracer trace ("graph::link");

    if (ctx.phase != run_phase::link)
      fail << "module " << m << " linked during " << ctx.phase << " phase";

    if (m.failed)
      fail << "module " << m << " previously failed";

    if (m.has_variants ())
      fail << "module " << m << " is split into variants" <<
        info << "link one of its variants instead";

    const link_strategy& ls (m.linker.strategy);

    if (ls.mode == link_mode::compiled)
      return nullptr;

    if (!m.output)
    {
      assert (ls.resolve != nullptr);

      m.output = ls.resolve (ctx, m);

      l5 ([&]{trace << m << " (" << ls.mode << ") -> " << *m.output;});
    }

    return &*m.output;
  }

  void graph::
  link ()
  {
    size_t errors (0);

    for (const unique_ptr<module>& p: modules_)
    {
      module& m (*p);

      if (m.failed || m.has_variants ())
        continue;

      try
      {
        link (m);
      }
      catch (const module_error& e)
      {
        diag_module_error (e);
        m.failed = true;
        ++errors;
      }
    }

    if (errors != 0)
      throw failed ();
  }
}
