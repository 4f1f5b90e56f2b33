// file      : libforge/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBFORGE_TYPES_HXX
#define LIBFORGE_TYPES_HXX

#include <map>
#include <array>
#include <vector>
#include <string>
#include <memory>           // unique_ptr, shared_ptr
#include <utility>          // pair, move()
#include <cstddef>          // size_t, nullptr_t
#include <cstdint>          // uint{8,16,32,64}_t
#include <ostream>
#include <functional>       // hash, function, reference_wrapper
#include <initializer_list>

#include <exception>     // exception
#include <stdexcept>     // logic_error, invalid_argument, runtime_error

#include <libbutl/path.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/small-vector.hxx>

#include <libforge/export.hxx>

namespace forge
{
  // Commonly-used types.
  //
  using std::uint8_t;
  using std::uint16_t;
  using std::uint32_t;
  using std::uint64_t;

  using std::size_t;
  using std::nullptr_t;

  using std::pair;
  using std::string;
  using std::reference_wrapper;

  using std::function;

  using strings = std::vector<string>;
  using cstrings = std::vector<const char*>;

  using std::initializer_list;

  using std::unique_ptr;
  using std::shared_ptr;

  using std::map;
  using std::array;
  using std::vector;
  using butl::small_vector; // <libbutl/small-vector.hxx>

  using std::ostream;
  using std::endl;

  // Exceptions.
  //
  // While <exception> is included, there is no using for std::exception --
  // use qualified.
  //
  using std::logic_error;
  using std::invalid_argument;
  using std::runtime_error;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using path_traits = path::traits_type;
  using butl::dir_path;
  using butl::path_cast;
  using butl::invalid_path;

  using paths = std::vector<path>;
  using dir_paths = std::vector<dir_path>;

  // Path printing with trailing slash for directories.
  //
  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, const path&); // utility.cxx

  inline ostream&
  operator<< (ostream& os, const dir_path& d) // For overload resolution.
  {
    return forge::operator<< (os, static_cast<const path&> (d));
  }

  // Graph phases. Modules are declared during load, split into variants
  // during mutate, and have their outputs resolved during link. The switch
  // from mutate to link is a barrier: no variant is created after it.
  //
  // See graph.
  //
  enum class run_phase {load, mutate, link};

  LIBFORGE_SYMEXPORT ostream&
  operator<< (ostream&, run_phase); // utility.cxx
}

#endif // LIBFORGE_TYPES_HXX
