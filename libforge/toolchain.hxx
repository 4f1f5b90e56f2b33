// file      : libforge/toolchain.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_TOOLCHAIN_HXX
#define LIBFORGE_TOOLCHAIN_HXX

#include <libforge/types.hxx>
#include <libforge/utility.hxx>

#include <libforge/export.hxx>

namespace forge
{
  // Target architectures.
  //
  enum class arch_type {arm, arm64, mips, mips64, x86, x86_64};

  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, arch_type);

  // Architecture metadata.
  //
  // The abi member is the primary ABI identifier which is used as the last
  // path component in the NDK STL library directories (for example,
  // armeabi-v7a for arm).
  //
  // Most 64-bit NDK sysroots are multilib and store 64-bit libraries in
  // usr/lib64. An architecture that is 64-bit-only has the non_multilib
  // flag set and keeps its libraries in usr/lib. This is a per-architecture
  // fact recorded in the table below and not something to derive.
  //
  struct arch_info
  {
    arch_type   type;
    const char* name;
    const char* abi;
    uint16_t    bits;
    bool        non_multilib;
  };

  LIBFORGE_SYMEXPORT const arch_info&
  lookup_arch (arch_type);

  // Return NULL if the name is not recognized.
  //
  LIBFORGE_SYMEXPORT const arch_info*
  lookup_arch (const string& name);

  // Toolchain descriptor: the architecture and compiler facts needed to
  // name and locate artifacts.
  //
  class LIBFORGE_SYMEXPORT toolchain
  {
  public:
    explicit
    toolchain (arch_type,
               string gcc_version = "4.9",
               string shlib_suffix = ".so",
               string alib_suffix = ".a");

    // Toolchain name as used in the NDK platform directories (arch-<name>).
    //
    const char*
    name () const {return arch_->name;}

    const arch_info&
    arch () const {return *arch_;}

    bool
    is_64bit () const {return arch_->bits == 64;}

    const string&
    gcc_version () const {return gcc_version_;}

    const string&
    shlib_suffix () const {return shlib_suffix_;}

    const string&
    alib_suffix () const {return alib_suffix_;}

  private:
    const arch_info* arch_;
    string gcc_version_;
    string shlib_suffix_;
    string alib_suffix_;
  };
}

#endif // LIBFORGE_TOOLCHAIN_HXX
