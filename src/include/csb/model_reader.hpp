#pragma once

#include <csb/namespace_def.hpp>
#include <csb/xml_reader.hpp>

#include <vector>

namespace csb {

  // Reads the XML model format (<api><namespace>...</namespace></api>) into
  // unresolved namespaces. Link and validate them with api::resolve.
  class model_reader {
  public:
    std::vector<namespace_def>
    parse(xml_reader& reader);
  };

} // namespace csb
