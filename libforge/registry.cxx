// file      : libforge/registry.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/registry.hxx>

#include <libforge/diagnostics.hxx>

using namespace std;

namespace forge
{
  void registry::
  insert (const module_functions* fs)
  {
    tracer trace ("registry::insert");

    for (const module_functions* f (fs); f->name != nullptr; ++f)
    {
      assert ((f->factory == nullptr) != (f->mutator == nullptr));

      if (f->factory != nullptr)
      {
        if (!types_.emplace (f->name, f->factory).second)
          fail << "module type " << f->name << " already registered";

        l5 ([&]{trace << "module type " << f->name;});
      }
      else
      {
        for (const mutator_entry& e: mutators_)
        {
          if (e.name == f->name)
            fail << "mutator " << f->name << " already registered";
        }

        mutators_.push_back (mutator_entry {f->name, f->mutator});

        l5 ([&]{trace << "mutator " << f->name;});
      }
    }
  }

  unique_ptr<module> registry::
  create (const string& type, string name) const
  {
    auto i (types_.find (type));

    if (i == types_.end ())
      fail << "unknown module type " << type << " for module " << name;

    unique_ptr<module> r (i->second (move (name)));
    assert (r->type == type);
    return r;
  }
}
