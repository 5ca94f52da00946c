#pragma once

#include <csb/facet_set.hpp>
#include <csb/type_id.hpp>

#include <memory>
#include <string_view>

namespace csb {

  enum class type_kind {
    void_type,
    boolean,
    int32,
    uint32,
    int64,
    uint64,
    float32,
    float64,
    string,
    binary,
    timestamp,
    list,
    nullable,
    composite,
  };

  // Schema spelling of a primitive kind ("Int32", "Timestamp", ...). Empty
  // for list, nullable and composite.
  std::string_view
  primitive_name(type_kind kind);

  // A modeled field type. List and nullable wrap exactly one inner type;
  // composite refers to a struct or union by name.
  class type_expr {
    type_kind kind_ = type_kind::void_type;
    facet_set facets_;
    std::shared_ptr<const type_expr> inner_;
    type_id composite_;

  public:
    type_expr() = default;

    explicit type_expr(type_kind kind, facet_set facets = {});

    static type_expr
    list_of(type_expr element, facet_set facets = {});

    static type_expr
    nullable_of(type_expr inner);

    static type_expr
    reference_to(type_id name);

    type_kind
    kind() const {
      return kind_;
    }

    const facet_set&
    facets() const {
      return facets_;
    }

    // Element type of a list, or wrapped type of a nullable.
    const type_expr&
    inner() const;

    const type_id&
    composite_name() const {
      return composite_;
    }

    bool
    is_void() const {
      return kind_ == type_kind::void_type;
    }

    bool
    is_nullable() const {
      return kind_ == type_kind::nullable;
    }

    bool
    is_list() const {
      return kind_ == type_kind::list;
    }

    bool
    is_composite() const {
      return kind_ == type_kind::composite;
    }

    bool
    is_string() const {
      return kind_ == type_kind::string;
    }

    bool
    is_numeric() const;

    // The type with one nullable layer removed, or this type.
    const type_expr&
    unwrap_nullable() const {
      return is_nullable() ? inner() : *this;
    }

    bool
    operator==(const type_expr& other) const;
  };

} // namespace csb
