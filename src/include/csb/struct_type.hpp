#pragma once

#include <csb/field.hpp>
#include <csb/type_id.hpp>

#include <optional>
#include <string>
#include <vector>

namespace csb {

  struct subtype_ref {
    std::string tag;
    type_id type;

    bool
    operator==(const subtype_ref&) const = default;
  };

  class struct_type {
    type_id name_;
    std::string doc_;
    std::optional<type_id> parent_;
    std::vector<field> fields_;
    std::vector<subtype_ref> subtypes_;
    bool catch_all_ = false;

  public:
    struct_type() = default;

    struct_type(type_id name, std::vector<field> fields,
                std::optional<type_id> parent = std::nullopt,
                std::vector<subtype_ref> subtypes = {},
                bool catch_all = false, std::string doc = {})
        : name_(std::move(name)), doc_(std::move(doc)),
          parent_(std::move(parent)), fields_(std::move(fields)),
          subtypes_(std::move(subtypes)), catch_all_(catch_all) {}

    const type_id&
    name() const {
      return name_;
    }

    const std::string&
    doc() const {
      return doc_;
    }

    const std::optional<type_id>&
    parent() const {
      return parent_;
    }

    // Own fields only; see api::all_fields for the inherited view.
    const std::vector<field>&
    fields() const {
      return fields_;
    }

    const std::vector<subtype_ref>&
    subtypes() const {
      return subtypes_;
    }

    bool
    has_enumerated_subtypes() const {
      return !subtypes_.empty();
    }

    bool
    is_catch_all() const {
      return catch_all_;
    }

    bool
    operator==(const struct_type&) const = default;
  };

} // namespace csb
