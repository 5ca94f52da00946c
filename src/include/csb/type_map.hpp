#pragma once

#include <csb/xml_reader.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>

namespace csb {

  // Target rendering of one primitive kind. Value types take the '?'
  // nullable marker; reference types are nullable already.
  struct type_mapping {
    std::string target_type;
    std::string literal_suffix;
    bool value_type = false;

    bool
    operator==(const type_mapping&) const = default;
  };

  // Primitive kind name ("Int32", "Timestamp", ...) to target type.
  class type_map {
    std::unordered_map<std::string, type_mapping> entries_;

  public:
    type_map() = default;

    static type_map
    defaults();

    // Reads <typemap><mapping type="..." target="..."/></typemap>.
    static type_map
    load(xml_reader& reader);

    void
    merge(const type_map& overrides);

    const type_mapping*
    find(const std::string& kind_name) const;

    // Like find, but a missing entry is an error.
    const type_mapping&
    at(const std::string& kind_name) const;

    void
    set(std::string kind_name, type_mapping mapping);

    std::size_t
    size() const;

    bool
    contains(const std::string& kind_name) const;
  };

} // namespace csb
