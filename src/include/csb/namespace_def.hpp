#pragma once

#include <csb/struct_type.hpp>
#include <csb/union_type.hpp>

#include <string>
#include <variant>
#include <vector>

namespace csb {

  using data_type = std::variant<struct_type, union_type>;

  inline const type_id&
  name_of(const data_type& t) {
    return std::visit([](const auto& v) -> const type_id& { return v.name(); },
                      t);
  }

  inline const std::string&
  doc_of(const data_type& t) {
    return std::visit(
        [](const auto& v) -> const std::string& { return v.doc(); }, t);
  }

  class namespace_def {
    std::string name_;
    std::string doc_;
    std::vector<data_type> data_types_;

  public:
    namespace_def() = default;

    explicit namespace_def(std::string name, std::string doc = {})
        : name_(std::move(name)), doc_(std::move(doc)) {}

    const std::string&
    name() const {
      return name_;
    }

    const std::string&
    doc() const {
      return doc_;
    }

    void
    set_doc(std::string doc) {
      doc_ = std::move(doc);
    }

    void
    add(data_type t) {
      data_types_.push_back(std::move(t));
    }

    const std::vector<data_type>&
    data_types() const {
      return data_types_;
    }

    bool
    operator==(const namespace_def&) const = default;
  };

} // namespace csb
