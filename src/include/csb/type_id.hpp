#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace csb {

  class type_id {
    std::string namespace_name_;
    std::string name_;

  public:
    type_id() = default;

    type_id(std::string namespace_name, std::string name)
        : namespace_name_(std::move(namespace_name)), name_(std::move(name)) {}

    const std::string&
    namespace_name() const {
      return namespace_name_;
    }

    const std::string&
    name() const {
      return name_;
    }

    bool
    empty() const {
      return name_.empty();
    }

    auto
    operator<=>(const type_id&) const = default;

    bool
    operator==(const type_id&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const type_id& id) {
      if (id.namespace_name_.empty()) return os << id.name_;
      return os << id.namespace_name_ << '.' << id.name_;
    }
  };

  inline std::string
  to_string(const type_id& id) {
    if (id.namespace_name().empty()) return id.name();
    return id.namespace_name() + "." + id.name();
  }

} // namespace csb

template <>
struct std::hash<csb::type_id> {
  std::size_t
  operator()(const csb::type_id& id) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(id.namespace_name());
    std::size_t h2 = std::hash<std::string>{}(id.name());
    return h1 ^ (h2 << 1);
  }
};
