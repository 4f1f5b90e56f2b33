// file      : libforge/registry.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_REGISTRY_HXX
#define LIBFORGE_REGISTRY_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/module.hxx>

#include <libforge/export.hxx>

namespace forge
{
  class graph;

  // Create a logical module of the registered type with the specified name.
  //
  using module_factory_function = unique_ptr<module> (string name);

  // Mutate a single module. Called once per module during the mutate phase
  // and may only touch that module (and the variants it creates) using the
  // graph primitives.
  //
  using mutator_function = void (graph&, module&);

  // Each component exposes a forge_<name>_load() function that returns an
  // array of module_functions entries terminated with an all-NULL entry.
  // An entry either describes a module type (factory is not NULL) or a
  // mutator (mutator is not NULL).
  //
  struct module_functions
  {
    const char*              name;
    module_factory_function* factory;
    mutator_function*        mutator;
  };

  // The load functions will be written in C++ and will be called from C++
  // but we keep them extern "C" so that they can be located with dlsym() or
  // equivalent.
  //
  extern "C"
  using module_load_function = const module_functions* ();

  // Module types and mutators known to the host. There is no global
  // instance: the host populates one during startup by passing the result
  // of each load function to insert().
  //
  class LIBFORGE_SYMEXPORT registry
  {
  public:
    // Issue diagnostics and throw failed on duplicate names.
    //
    void
    insert (const module_functions*);

    // Create a module of the specified type. Issue diagnostics and throw
    // failed if the type is unknown.
    //
    unique_ptr<module>
    create (const string& type, string name) const;

    bool
    find_type (const string& type) const
    {
      return types_.find (type) != types_.end ();
    }

    // Mutators in the registration order.
    //
    struct mutator_entry
    {
      string            name;
      mutator_function* function;
    };

    const vector<mutator_entry>&
    mutators () const {return mutators_;}

  private:
    map<string, module_factory_function*> types_;
    vector<mutator_entry> mutators_;
  };
}

#endif // LIBFORGE_REGISTRY_HXX
