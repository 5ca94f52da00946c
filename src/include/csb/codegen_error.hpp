#pragma once

#include <stdexcept>
#include <string>

namespace csb {

  // A model the generator cannot honour: a default on a struct-typed field,
  // a tag dispatch without a modeled branch, an unmapped type kind. Aborts
  // the run; nothing is written.
  class codegen_error : public std::logic_error {
  public:
    explicit codegen_error(const std::string& what)
        : std::logic_error("codegen: " + what) {}
  };

} // namespace csb
