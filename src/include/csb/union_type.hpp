#pragma once

#include <csb/field.hpp>
#include <csb/type_id.hpp>

#include <optional>
#include <string>
#include <vector>

namespace csb {

  class union_type {
    type_id name_;
    std::string doc_;
    std::vector<union_field> fields_;
    std::optional<std::string> catch_all_;

  public:
    union_type() = default;

    union_type(type_id name, std::vector<union_field> fields,
               std::optional<std::string> catch_all = std::nullopt,
               std::string doc = {})
        : name_(std::move(name)), doc_(std::move(doc)),
          fields_(std::move(fields)), catch_all_(std::move(catch_all)) {}

    const type_id&
    name() const {
      return name_;
    }

    const std::string&
    doc() const {
      return doc_;
    }

    const std::vector<union_field>&
    fields() const {
      return fields_;
    }

    const union_field*
    find_field(const std::string& name) const {
      for (const auto& f : fields_) {
        if (f.name() == name) return &f;
      }
      return nullptr;
    }

    const std::optional<std::string>&
    catch_all_field() const {
      return catch_all_;
    }

    bool
    operator==(const union_type&) const = default;
  };

} // namespace csb
