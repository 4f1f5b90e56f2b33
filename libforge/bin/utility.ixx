// file      : libforge/bin/utility.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace forge
{
  namespace bin
  {
    inline const char*
    variation (otype t)
    {
      return t == otype::a ? "static" : "shared";
    }

    inline otype
    link_type (const library_linker& l)
    {
      return l.static_ () ? otype::a : otype::s;
    }

    inline lmembers
    link_members (const module& m)
    {
      const optional<library_linker>& l (m.linker.library);

      return l
        ? lmembers {l->build_static, l->build_shared}
        : lmembers {false, false};
    }
  }
}
