// file      : libforge/graph.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_GRAPH_HXX
#define LIBFORGE_GRAPH_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/module.hxx>
#include <libforge/context.hxx>
#include <libforge/registry.hxx>

#include <libforge/export.hxx>

namespace forge
{
  // The build graph: modules together with the primitives the mutators use
  // to rewrite it and the drivers of the mutate and link phases.
  //
  // The graph owns its modules; pointers and references to them remain
  // valid for the graph's lifetime.
  //
  class LIBFORGE_SYMEXPORT graph
  {
  public:
    context& ctx;

    explicit
    graph (context& c): ctx (c) {}

    graph (const graph&) = delete;
    graph& operator= (const graph&) = delete;

    // Declare a logical module. Only allowed during the load phase. Issue
    // diagnostics and throw failed if a module with this name is already
    // declared.
    //
    module&
    insert (unique_ptr<module>);

    // Find a logical module (empty variation) or its variant. Return NULL
    // if not found.
    //
    module*
    find (const string& name, const string& variation = string ());

    const vector<unique_ptr<module>>&
    modules () const {return modules_;}

    // Mutator primitives.
    //
    // Create variants of a logical module, one per name, returned in the
    // order of names. Each variant is a copy of the module with the
    // variation set. Only allowed during the mutate phase and only once per
    // module.
    //
    small_vector<module*, 2>
    create_variants (module&, initializer_list<const char*> names);

    // Record a build-order dependency of one module on another.
    //
    void
    add_dependency (module& from, const module& to, dependency_tag);

    // Run the mutate phase: each registered mutator is invoked once for
    // every module declared during load, after which the graph switches to
    // the link phase. If processing of a module fails, the module is marked
    // as failed and the rest are still processed. Throw failed at the end
    // if any module failed.
    //
    // Running the mutate phase more than once is a programming error that
    // is diagnosed.
    //
    void
    mutate (const registry&);

    // Return the output path of a module, computing it on the first call.
    // Return NULL for a compiled module (its output is produced by the
    // compile/link rules). Throw module_error if the path cannot be
    // resolved.
    //
    // Only allowed during the link phase and for modules that are built
    // (that is, not logical modules that were split into variants).
    //
    const path*
    link (module&);

    // Resolve outputs of all the built modules with the same failure
    // semantics as mutate().
    //
    void
    link ();

  private:
    vector<unique_ptr<module>> modules_;
  };
}

#endif // LIBFORGE_GRAPH_HXX
