#include <csb/api.hpp>

#include <csb/naming.hpp>

#include <set>
#include <stdexcept>
#include <string>

namespace csb {

  namespace {

    [[noreturn]] void
    fail(const std::string& msg) {
      throw std::runtime_error("api: " + msg);
    }

    std::string
    quoted(const type_id& id) {
      return "'" + to_string(id) + "'";
    }

    bool
    is_number(const std::string& text, bool allow_fraction) {
      if (text.empty()) return false;
      std::size_t i = 0;
      if (text[0] == '-' || text[0] == '+') i = 1;
      bool digits = false;
      bool dot = false;
      for (; i < text.size(); ++i) {
        char c = text[i];
        if (c >= '0' && c <= '9') {
          digits = true;
        } else if (c == '.' && allow_fraction && !dot) {
          dot = true;
        } else if ((c == 'e' || c == 'E') && allow_fraction && digits) {
          std::size_t j = i + 1;
          if (j < text.size() && (text[j] == '-' || text[j] == '+')) ++j;
          if (j == text.size()) return false;
          for (; j < text.size(); ++j) {
            if (text[j] < '0' || text[j] > '9') return false;
          }
          return true;
        } else {
          return false;
        }
      }
      return digits;
    }

    bool
    is_unsigned(type_kind kind) {
      return kind == type_kind::uint32 || kind == type_kind::uint64;
    }

    bool
    is_float(type_kind kind) {
      return kind == type_kind::float32 || kind == type_kind::float64;
    }

    void
    check_number(const type_expr& t, const std::string& text,
                 const std::string& where) {
      if (!is_number(text, is_float(t.kind())) ||
          (is_unsigned(t.kind()) && text[0] == '-')) {
        fail(where + ": '" + text + "' is not a valid " +
             std::string(primitive_name(t.kind())) + " value");
      }
    }

    // Facets must match the kind they decorate, and numeric bounds must be
    // literals of that kind.
    void
    check_facets(const type_expr& t, const std::string& where) {
      const auto& f = t.facets();
      if ((f.min_value || f.max_value) && !t.is_numeric())
        fail(where + ": value bounds on a non-numeric type");
      if ((f.min_length || f.max_length || f.pattern) && !t.is_string())
        fail(where + ": length or pattern on a non-string type");
      if ((f.min_items || f.max_items) && !t.is_list())
        fail(where + ": item bounds on a non-list type");
      if (f.min_value) check_number(t, *f.min_value, where);
      if (f.max_value) check_number(t, *f.max_value, where);
      if (f.min_length && f.max_length && *f.min_length > *f.max_length)
        fail(where + ": min-length exceeds max-length");
      if (f.min_items && f.max_items && *f.min_items > *f.max_items)
        fail(where + ": min-items exceeds max-items");
      if (t.is_list() || t.is_nullable()) check_facets(t.inner(), where);
    }

  } // namespace

  void
  api::add(namespace_def ns) {
    namespaces_.push_back(std::move(ns));
    resolved_ = false;
  }

  const namespace_def*
  api::find_namespace(const std::string& name) const {
    for (const auto& ns : namespaces_) {
      if (ns.name() == name) return &ns;
    }
    return nullptr;
  }

  const data_type*
  api::find(const type_id& name) const {
    const auto* ns = find_namespace(name.namespace_name());
    if (ns == nullptr) return nullptr;
    for (const auto& t : ns->data_types()) {
      if (name_of(t) == name) return &t;
    }
    return nullptr;
  }

  const struct_type*
  api::find_struct(const type_id& name) const {
    const auto* t = find(name);
    if (t == nullptr) return nullptr;
    return std::get_if<struct_type>(t);
  }

  const union_type*
  api::find_union(const type_id& name) const {
    const auto* t = find(name);
    if (t == nullptr) return nullptr;
    return std::get_if<union_type>(t);
  }

  std::vector<field>
  api::all_fields(const struct_type& s) const {
    std::vector<field> result;
    if (s.parent()) {
      const auto* parent = find_struct(*s.parent());
      if (parent == nullptr)
        fail("unresolved parent " + quoted(*s.parent()) + " of " +
             quoted(s.name()));
      result = all_fields(*parent);
    }
    result.insert(result.end(), s.fields().begin(), s.fields().end());
    return result;
  }

  void
  api::resolve() {
    resolved_ = false;

    // Phase 1: names are unique, also after conversion to public names
    std::set<std::string> ns_names;
    std::set<type_id> type_names;
    for (const auto& ns : namespaces_) {
      if (!ns_names.insert(public_name(ns.name())).second)
        fail("duplicate namespace '" + ns.name() + "'");
      std::set<std::string> public_types;
      for (const auto& t : ns.data_types()) {
        if (!public_types.insert(public_name(name_of(t).name())).second)
          fail("type " + quoted(name_of(t)) +
               " collides with another type of its namespace");
        if (name_of(t).namespace_name() != ns.name())
          fail("type " + quoted(name_of(t)) + " declared in namespace '" +
               ns.name() + "'");
        if (!type_names.insert(name_of(t)).second)
          fail("duplicate type " + quoted(name_of(t)));
      }
    }

    // Phase 2: every composite reference resolves
    auto check_refs = [&](const type_expr& t, const std::string& where,
                          auto& self) -> void {
      if (t.is_composite()) {
        if (find(t.composite_name()) == nullptr)
          fail("unresolved type reference " + quoted(t.composite_name()) +
               " in " + where);
      } else if (t.is_list() || t.is_nullable()) {
        self(t.inner(), where, self);
      }
    };

    for (const auto& ns : namespaces_) {
      for (const auto& t : ns.data_types()) {
        if (const auto* s = std::get_if<struct_type>(&t)) {
          for (const auto& f : s->fields()) {
            std::string where = to_string(s->name()) + "." + f.name();
            check_refs(f.type(), where, check_refs);
            check_facets(f.type(), where);
          }
          if (s->parent() && find_struct(*s->parent()) == nullptr)
            fail("unresolved parent " + quoted(*s->parent()) + " of " +
                 quoted(s->name()));
          for (const auto& sub : s->subtypes()) {
            if (find_struct(sub.type) == nullptr)
              fail("unresolved subtype " + quoted(sub.type) + " of " +
                   quoted(s->name()));
          }
        } else {
          const auto& u = std::get<union_type>(t);
          std::set<std::string> seen;
          for (const auto& f : u.fields()) {
            std::string where = to_string(u.name()) + "." + f.name();
            if (!seen.insert(public_name(f.name())).second)
              fail("duplicate variant '" + f.name() + "' in " +
                   quoted(u.name()));
            if (f.type().is_nullable())
              fail(where + ": union variants cannot be nullable");
            check_refs(f.type(), where, check_refs);
            check_facets(f.type(), where);
          }
          if (u.catch_all_field()) {
            const auto* ca = u.find_field(*u.catch_all_field());
            if (ca == nullptr)
              fail("catch-all '" + *u.catch_all_field() +
                   "' is not a variant of " + quoted(u.name()));
            if (!ca->is_void())
              fail("catch-all '" + *u.catch_all_field() + "' of " +
                   quoted(u.name()) + " must be a void variant");
          }
        }
      }
    }

    // Phase 3: inheritance is acyclic and families are well formed
    for (const auto& ns : namespaces_) {
      for (const auto& t : ns.data_types()) {
        const auto* s = std::get_if<struct_type>(&t);
        if (s == nullptr) continue;

        std::set<type_id> chain{s->name()};
        for (auto p = s->parent(); p; p = find_struct(*p)->parent()) {
          if (!chain.insert(*p).second)
            fail("inheritance cycle through " + quoted(s->name()));
        }

        std::set<std::string> names;
        for (const auto& f : all_fields(*s)) {
          if (!names.insert(public_name(f.name())).second)
            fail("duplicate field '" + f.name() + "' in " +
                 quoted(s->name()));
        }

        if (s->parent()) {
          const auto* parent = find_struct(*s->parent());
          if (parent->has_enumerated_subtypes()) {
            bool listed = false;
            for (const auto& sub : parent->subtypes()) {
              if (sub.type == s->name()) listed = true;
            }
            if (!listed)
              fail(quoted(s->name()) + " extends " + quoted(parent->name()) +
                   " but is not one of its subtypes");
            if (s->has_enumerated_subtypes())
              fail("subtype " + quoted(s->name()) +
                   " cannot enumerate subtypes of its own");
          }
        }

        bool in_family = s->has_enumerated_subtypes();
        if (s->parent())
          in_family = in_family ||
                      find_struct(*s->parent())->has_enumerated_subtypes();
        if (s->is_catch_all() && !in_family)
          fail(quoted(s->name()) +
               " is marked catch-all outside a subtype family");

        if (!s->has_enumerated_subtypes()) continue;

        std::set<std::string> tags;
        int catch_alls = s->is_catch_all() ? 1 : 0;
        for (const auto& sub : s->subtypes()) {
          const auto* child = find_struct(sub.type);
          if (!child->parent() || *child->parent() != s->name())
            fail("subtype " + quoted(sub.type) + " of " + quoted(s->name()) +
                 " does not extend it");
          if (child->is_catch_all()) {
            ++catch_alls;
            continue;
          }
          if (sub.tag.empty())
            fail("subtype " + quoted(sub.type) + " of " + quoted(s->name()) +
                 " has an empty tag");
          if (!tags.insert(sub.tag).second)
            fail("duplicate tag '" + sub.tag + "' in " + quoted(s->name()));
        }
        if (catch_alls > 1)
          fail("more than one catch-all in the family of " +
               quoted(s->name()));
      }
    }

    // Phase 4: defaults are representable
    for (const auto& ns : namespaces_) {
      for (const auto& t : ns.data_types()) {
        const auto* s = std::get_if<struct_type>(&t);
        if (s == nullptr) continue;
        for (const auto& f : s->fields()) {
          if (!f.has_default()) continue;
          std::string where = to_string(s->name()) + "." + f.name();
          const auto& ft = f.type().unwrap_nullable();
          const auto& value = *f.default_value();
          switch (ft.kind()) {
            case type_kind::composite:
              if (const auto* u = find_union(ft.composite_name())) {
                const auto* v = u->find_field(value);
                if (v == nullptr || !v->is_void())
                  fail(where + ": default '" + value +
                       "' is not a void variant of " + quoted(u->name()));
              } else {
                fail(where + ": struct-typed fields cannot have a default");
              }
              break;
            case type_kind::boolean:
              if (value != "true" && value != "false")
                fail(where + ": '" + value + "' is not a Boolean value");
              break;
            case type_kind::string:
              break;
            default:
              if (!ft.is_numeric())
                fail(where + ": " +
                     (ft.is_list() ? std::string("List")
                                   : std::string(primitive_name(ft.kind()))) +
                     " fields cannot have a default");
              check_number(ft, value, where);
              break;
          }
        }
      }
    }

    resolved_ = true;
  }

} // namespace csb
