// file      : libforge/bin/variant.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_BIN_VARIANT_HXX
#define LIBFORGE_BIN_VARIANT_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/graph.hxx>
#include <libforge/module.hxx>

#include <libforge/bin/types.hxx>

#include <libforge/export.hxx>

namespace forge
{
  namespace bin
  {
    // Library module declares neither static nor shared builds.
    //
    struct LIBFORGE_SYMEXPORT configuration_error: module_error
    {
      explicit
      configuration_error (string module);
    };

    // Split a library module into its static and/or shared variants.
    //
    // If both kinds are declared, then return two variants in the [static,
    // shared] order (callers index on it). Otherwise, return one variant of
    // the declared kind. Throw configuration_error if neither is declared,
    // in which case no variant is created.
    //
    LIBFORGE_SYMEXPORT small_vector<module*, 2>
    expand_variants (graph&, module&);

    // Arrange for the shared variant to link the static variant's objects
    // instead of compiling the same sources again. This is only done if
    // neither variant has kind-specific compile flags, in which case the
    // object code would be identical. Return true if the objects are reused.
    //
    // The two variants must be siblings (see expand_variants()).
    //
    LIBFORGE_SYMEXPORT bool
    reuse_objects (graph&, module& static_variant, module& shared_variant);

    // The link mutator: expand library modules into variants and reuse the
    // objects where possible. Modules that don't produce a library are left
    // alone.
    //
    LIBFORGE_SYMEXPORT void
    link_mutator (graph&, module&);
  }
}

#endif // LIBFORGE_BIN_VARIANT_HXX
