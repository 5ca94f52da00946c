#pragma once

#include <csb/cs_code.hpp>

#include <string>

namespace csb {

  class cs_writer {
  public:
    std::string
    write(const cs_file& file) const;

    std::string
    write(const cs_doc_file& file) const;
  };

} // namespace csb
