#include <csb/type_expr.hpp>

#include <stdexcept>
#include <utility>

namespace csb {

  std::string_view
  primitive_name(type_kind kind) {
    switch (kind) {
      case type_kind::void_type:
        return "Void";
      case type_kind::boolean:
        return "Boolean";
      case type_kind::int32:
        return "Int32";
      case type_kind::uint32:
        return "UInt32";
      case type_kind::int64:
        return "Int64";
      case type_kind::uint64:
        return "UInt64";
      case type_kind::float32:
        return "Float32";
      case type_kind::float64:
        return "Float64";
      case type_kind::string:
        return "String";
      case type_kind::binary:
        return "Binary";
      case type_kind::timestamp:
        return "Timestamp";
      case type_kind::list:
      case type_kind::nullable:
      case type_kind::composite:
        break;
    }
    return {};
  }

  type_expr::type_expr(type_kind kind, facet_set facets)
      : kind_(kind), facets_(std::move(facets)) {
    if (kind == type_kind::list || kind == type_kind::nullable ||
        kind == type_kind::composite) {
      throw std::invalid_argument(
          "type_expr: list, nullable and composite types need a factory");
    }
  }

  type_expr
  type_expr::list_of(type_expr element, facet_set facets) {
    type_expr t;
    t.kind_ = type_kind::list;
    t.facets_ = std::move(facets);
    t.inner_ = std::make_shared<const type_expr>(std::move(element));
    return t;
  }

  type_expr
  type_expr::nullable_of(type_expr inner) {
    if (inner.is_nullable()) return inner;
    if (inner.is_void())
      throw std::invalid_argument("type_expr: void cannot be nullable");
    type_expr t;
    t.kind_ = type_kind::nullable;
    t.inner_ = std::make_shared<const type_expr>(std::move(inner));
    return t;
  }

  type_expr
  type_expr::reference_to(type_id name) {
    type_expr t;
    t.kind_ = type_kind::composite;
    t.composite_ = std::move(name);
    return t;
  }

  const type_expr&
  type_expr::inner() const {
    if (!inner_)
      throw std::logic_error("type_expr: type has no inner type");
    return *inner_;
  }

  bool
  type_expr::is_numeric() const {
    switch (kind_) {
      case type_kind::int32:
      case type_kind::uint32:
      case type_kind::int64:
      case type_kind::uint64:
      case type_kind::float32:
      case type_kind::float64:
        return true;
      default:
        return false;
    }
  }

  bool
  type_expr::operator==(const type_expr& other) const {
    if (kind_ != other.kind_ || facets_ != other.facets_ ||
        composite_ != other.composite_)
      return false;
    if (!inner_ || !other.inner_) return inner_ == other.inner_;
    return *inner_ == *other.inner_;
  }

} // namespace csb
