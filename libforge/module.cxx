// file      : libforge/module.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libforge/module.hxx>

using namespace std;

namespace forge
{
  ostream&
  operator<< (ostream& os, dependency_tag t)
  {
    switch (t)
    {
    case dependency_tag::reuse_objects: os << "reuse-objects"; break;
    }

    return os;
  }

  ostream&
  operator<< (ostream& os, link_mode m)
  {
    return os << (m == link_mode::compiled ? "compiled" : "prebuilt");
  }

  const dependency* module::
  find_dependency (dependency_tag t) const
  {
    for (const dependency& d: dependencies)
    {
      if (d.tag == t)
        return &d;
    }

    return nullptr;
  }

  ostream&
  operator<< (ostream& os, const module& m)
  {
    os << m.name;

    if (!m.variation.empty ())
      os << '{' << m.variation << '}';

    return os;
  }
}
