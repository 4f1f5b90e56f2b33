// file      : libforge/module.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_MODULE_HXX
#define LIBFORGE_MODULE_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/export.hxx>

namespace forge
{
  class module;
  class context;

  // Module declaration error. Thrown by the mutate and link machinery when a
  // module cannot be processed because of how it is declared or named. The
  // module member is the offending module's name and value is the offending
  // value (prefix, flavor, etc), if any.
  //
  // The graph pass runners catch these, issue diagnostics, and abort the
  // module's build.
  //
  struct LIBFORGE_SYMEXPORT module_error: invalid_argument
  {
    string module;
    string value;

    module_error (const string& what, string m, string v = string ())
        : invalid_argument (what), module (move (m)), value (move (v)) {}
  };

  // Module dependency. Recorded with graph::add_dependency().
  //
  enum class dependency_tag
  {
    reuse_objects // Link against the target's objects instead of compiling.
  };

  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, dependency_tag);

  struct dependency
  {
    dependency_tag tag;
    const module*  target;
  };

  // Compiler properties.
  //
  // Besides the flags common to all variants, a library compiler has flags
  // that only apply when compiling for one kind of library. Such flags make
  // the object code of the two variants differ.
  //
  struct library_compiler
  {
    strings static_cflags;
    strings shared_cflags;
  };

  struct module_compiler
  {
    strings srcs;
    strings generated_sources;
    strings cflags;

    // Absent if the module is not compiled as a library.
    //
    optional<library_compiler> library;
  };

  // Library capability of a linker.
  //
  // The build_static/build_shared flags are what the module declares it can
  // be built as. After mutation each variant is exactly one of those as
  // reflected by static_().
  //
  class library_linker
  {
  public:
    bool build_static = false;
    bool build_shared = false;

    bool
    static_ () const {return static_flag_;}

    void
    set_static (bool s) {static_flag_ = s;}

  private:
    bool static_flag_ = false;
  };

  // Link strategy.
  //
  // A compiled module links objects produced from its sources (or from the
  // sources of a sibling variant it reuses). A prebuilt module compiles
  // nothing and its link step only computes the path of an artifact that
  // ships with the build system.
  //
  enum class link_mode {compiled, prebuilt};

  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, link_mode);

  // Compute the path of the prebuilt artifact. Throw module_error if the
  // module cannot be resolved.
  //
  using prebuilt_resolve_function = path (const context&, module&);

  struct link_strategy
  {
    link_mode mode = link_mode::compiled;

    // Prebuilt only.
    //
    prebuilt_resolve_function* resolve = nullptr;
  };

  struct module_linker
  {
    link_strategy strategy;

    // Absent if the linker does not produce a library (for example, a
    // prebuilt object file).
    //
    optional<library_linker> library;

    // Include directories exported to dependents and the resulting flags.
    // The flags are set during link.
    //
    dir_paths export_include_dirs;
    strings exported_flags;
  };

  // A module: a node in the build graph.
  //
  // The host declares logical modules during the load phase. During the
  // mutate phase a library module is split into one or two variants, each a
  // copy of the logical module with the variation set to the library kind.
  // Variants share the logical module name and point back to it with the
  // group member. The logical module itself is not built once it has
  // variants.
  //
  class LIBFORGE_SYMEXPORT module
  {
  public:
    string name;
    string type;      // Module type as registered (library, ndk_*, etc).
    string variation; // Empty for logical modules.

    module (string n, string t): name (move (n)), type (move (t)) {}

    // Logical module this variant was created from, if any.
    //
    const module* group = nullptr;

    // Variants this logical module was split into, in the creation order.
    //
    small_vector<module*, 2> variants;

    module_compiler compiler;
    module_linker   linker;

    // Platform (SDK) version this module is built against. If absent, the
    // context's default is used.
    //
    optional<string> sdk_version;

    // Do not expose to make-style exports.
    //
    bool hide_from_make = false;

    // Installed alongside the application rather than only used at link
    // time.
    //
    bool install = false;

    vector<dependency> dependencies;

    // Output path, computed on the first link request and cached for the
    // rest of the module's life. Absent for compiled modules whose output is
    // produced by the compile/link rules.
    //
    optional<path> output;

    // Set if processing of this module was aborted due to an error.
    //
    bool failed = false;

    // Return the dependency with the specified tag or NULL.
    //
    const dependency*
    find_dependency (dependency_tag) const;

    bool
    has_variants () const {return !variants.empty ();}
  };

  // Print as name or name{variation}.
  //
  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, const module&);
}

#endif // LIBFORGE_MODULE_HXX
