#pragma once

#include <csb/namespace_def.hpp>

#include <vector>

namespace csb {

  // The whole type model for one generation run: every namespace, linked
  // and validated by resolve().
  class api {
    std::vector<namespace_def> namespaces_;
    bool resolved_ = false;

  public:
    api() = default;

    void
    add(namespace_def ns);

    // Checks references, hierarchies, tags and defaults. Throws
    // std::runtime_error naming the first violation.
    void
    resolve();

    bool
    resolved() const {
      return resolved_;
    }

    const namespace_def*
    find_namespace(const std::string& name) const;

    const data_type*
    find(const type_id& name) const;

    const struct_type*
    find_struct(const type_id& name) const;

    const union_type*
    find_union(const type_id& name) const;

    // Inherited fields first, then own fields.
    std::vector<field>
    all_fields(const struct_type& s) const;

    const std::vector<namespace_def>&
    namespaces() const {
      return namespaces_;
    }
  };

} // namespace csb
