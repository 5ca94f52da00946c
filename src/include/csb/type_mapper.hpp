#pragma once

#include <csb/api.hpp>
#include <csb/naming.hpp>
#include <csb/type_expr.hpp>
#include <csb/type_map.hpp>

#include <string>
#include <string_view>

namespace csb {

  // Lists render as IList for stored properties and IEnumerable for
  // constructor parameters.
  enum class type_usage { parameter, property };

  // Where a type reference is being rendered: the schema namespace of the
  // generated file and the names declared by the enclosing constructs.
  struct mapping_context {
    std::string current_namespace;
    name_scope scope;
  };

  class type_mapper {
    const api& api_;
    const type_map& types_;
    name_cache& names_;
    std::string root_namespace_;

  public:
    type_mapper(const api& model, const type_map& types, name_cache& names,
                std::string root_namespace);

    std::string
    map(const type_expr& type, const mapping_context& ctx,
        type_usage usage = type_usage::parameter) const;

    // As map, but Void becomes the unit placeholder enc.Empty.
    std::string
    map_value(const type_expr& type, const mapping_context& ctx) const;

    // Public type name, prefixed with the namespace when it lives elsewhere
    // and fully qualified when the short form is shadowed by a local name.
    std::string
    composite_name(const type_id& id, const mapping_context& ctx) const;

    // Nested class declared for a union variant. A variant named like its
    // union takes a Variant suffix until the name is free.
    std::string
    variant_class_name(const union_type& u, const std::string& variant) const;

    std::string
    literal_suffix(const type_expr& type) const;

    // Renders a declared default as a literal of the field's type.
    std::string
    literal(const type_expr& type, const std::string& value,
            const mapping_context& ctx) const;

    // Reference-like types that need null rejection: composites, strings
    // and lists.
    bool
    could_be_null(const type_expr& type) const;

    bool
    is_value_type(const type_expr& type) const;

    name_cache&
    names() const {
      return names_;
    }
  };

  // @"..." with embedded quotes doubled.
  std::string
  verbatim_string(std::string_view text);

} // namespace csb
