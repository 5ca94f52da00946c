#pragma once

#include <csb/type_expr.hpp>

#include <optional>
#include <string>

namespace csb {

  // A struct member. The default keeps its schema spelling: a literal for
  // scalars and strings, or a void variant name for union-typed fields.
  class field {
    std::string name_;
    type_expr type_;
    std::optional<std::string> default_value_;
    std::string doc_;

  public:
    field() = default;

    field(std::string name, type_expr type,
          std::optional<std::string> default_value = std::nullopt,
          std::string doc = {})
        : name_(std::move(name)), type_(std::move(type)),
          default_value_(std::move(default_value)), doc_(std::move(doc)) {}

    const std::string&
    name() const {
      return name_;
    }

    const type_expr&
    type() const {
      return type_;
    }

    const std::optional<std::string>&
    default_value() const {
      return default_value_;
    }

    bool
    has_default() const {
      return default_value_.has_value();
    }

    const std::string&
    doc() const {
      return doc_;
    }

    bool
    operator==(const field&) const = default;
  };

  // A union variant. Void variants carry only their tag.
  class union_field {
    std::string name_;
    type_expr type_;
    std::string doc_;

  public:
    union_field() = default;

    union_field(std::string name, type_expr type = type_expr(),
                std::string doc = {})
        : name_(std::move(name)), type_(std::move(type)),
          doc_(std::move(doc)) {}

    const std::string&
    name() const {
      return name_;
    }

    const type_expr&
    type() const {
      return type_;
    }

    bool
    is_void() const {
      return type_.is_void();
    }

    const std::string&
    doc() const {
      return doc_;
    }

    bool
    operator==(const union_field&) const = default;
  };

} // namespace csb
