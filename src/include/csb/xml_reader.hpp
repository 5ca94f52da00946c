#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace csb {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style view over an XML document. Model and type map files are
  // plain XML without namespaces, so names are unqualified.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const std::string&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const std::string&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::optional<std::string_view>
    find_attribute(std::string_view name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // Source line of the current node, for diagnostics.
    virtual std::size_t
    line() const = 0;
  };

} // namespace csb
