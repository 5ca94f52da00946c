#pragma once

#include <csb/api.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace csb {

  // A member of a struct family. Catch-all members have no fixed tag.
  struct family_member {
    const struct_type* type = nullptr;
    std::optional<std::string> tag;

    bool
    operator==(const family_member&) const = default;
  };

  // Answers tag and open/closed questions about struct families and unions.
  // Tags are memoized for the lifetime of the resolver.
  class hierarchy_resolver {
    const api& api_;
    std::unordered_map<type_id, std::optional<std::string>> tags_;

  public:
    explicit hierarchy_resolver(const api& model) : api_(model) {}

    // The parent whose subtype list names s, or nullptr.
    const struct_type*
    enumerating_parent(const struct_type& s) const;

    // The tag s is written with. Empty for a catch-all member and for
    // structs outside any family.
    const std::optional<std::string>&
    tag(const struct_type& s);

    std::vector<family_member>
    subtypes(const struct_type& root);

    // The fallback for unrecognized tags: the root itself or one of its
    // subtypes. nullptr for a closed family.
    const struct_type*
    catch_all(const struct_type& root) const;

    bool
    is_open(const struct_type& root) const {
      return catch_all(root) != nullptr;
    }

    bool
    is_open(const union_type& u) const {
      return u.catch_all_field().has_value();
    }

    std::size_t
    cached_tags() const {
      return tags_.size();
    }
  };

  using related_map = std::map<type_id, std::set<type_id>>;

  // Structs related to each struct of ns: its parent, its subtypes, and the
  // structs that hold it in a field.
  related_map
  related_types(const namespace_def& ns, const api& model);

} // namespace csb
