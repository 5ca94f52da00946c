#include <csb/hierarchy.hpp>

#include <csb/codegen_error.hpp>

#include <utility>

namespace csb {

  const struct_type*
  hierarchy_resolver::enumerating_parent(const struct_type& s) const {
    if (!s.parent()) return nullptr;
    const auto* parent = api_.find_struct(*s.parent());
    if (parent == nullptr)
      throw codegen_error("unresolved parent of '" + to_string(s.name()) +
                          "'");
    if (!parent->has_enumerated_subtypes()) return nullptr;
    return parent;
  }

  const std::optional<std::string>&
  hierarchy_resolver::tag(const struct_type& s) {
    auto it = tags_.find(s.name());
    if (it != tags_.end()) return it->second;

    std::optional<std::string> result;
    if (const auto* parent = enumerating_parent(s); parent && !s.is_catch_all()) {
      for (const auto& sub : parent->subtypes()) {
        if (sub.type == s.name()) result = sub.tag;
      }
      if (!result)
        throw codegen_error("'" + to_string(s.name()) +
                            "' is missing from the subtypes of '" +
                            to_string(parent->name()) + "'");
    }
    return tags_.emplace(s.name(), std::move(result)).first->second;
  }

  std::vector<family_member>
  hierarchy_resolver::subtypes(const struct_type& root) {
    std::vector<family_member> result;
    for (const auto& sub : root.subtypes()) {
      const auto* child = api_.find_struct(sub.type);
      if (child == nullptr)
        throw codegen_error("unresolved subtype '" + to_string(sub.type) +
                            "'");
      result.push_back({child, tag(*child)});
    }
    return result;
  }

  const struct_type*
  hierarchy_resolver::catch_all(const struct_type& root) const {
    if (root.is_catch_all()) return &root;
    for (const auto& sub : root.subtypes()) {
      const auto* child = api_.find_struct(sub.type);
      if (child != nullptr && child->is_catch_all()) return child;
    }
    return nullptr;
  }

  related_map
  related_types(const namespace_def& ns, const api& model) {
    related_map related;
    for (const auto& t : ns.data_types()) {
      const auto* s = std::get_if<struct_type>(&t);
      if (s == nullptr) continue;

      if (s->parent()) {
        related[*s->parent()].insert(s->name());
        related[s->name()].insert(*s->parent());
      }

      for (const auto& f : model.all_fields(*s)) {
        const auto& ft = f.type().unwrap_nullable();
        if (!ft.is_composite()) continue;
        if (model.find_struct(ft.composite_name()) == nullptr) continue;
        if (ft.composite_name() == s->name()) continue;
        related[ft.composite_name()].insert(s->name());
      }
    }
    return related;
  }

} // namespace csb
