#include <csb/type_mapper.hpp>

#include <csb/codegen_error.hpp>

#include <set>
#include <utility>

namespace csb {

  namespace {

    std::string
    kind_key(const type_expr& t) {
      return std::string(primitive_name(t.kind()));
    }

  } // namespace

  type_mapper::type_mapper(const api& model, const type_map& types,
                           name_cache& names, std::string root_namespace)
      : api_(model), types_(types), names_(names),
        root_namespace_(std::move(root_namespace)) {}

  std::string
  type_mapper::map(const type_expr& type, const mapping_context& ctx,
                   type_usage usage) const {
    switch (type.kind()) {
      case type_kind::nullable: {
        const auto& inner = type.inner();
        auto result = map(inner, ctx, usage);
        if (is_value_type(inner)) result += '?';
        return result;
      }
      case type_kind::list: {
        auto element = map(type.inner(), ctx);
        if (usage == type_usage::property) return "col.IList<" + element + ">";
        return "col.IEnumerable<" + element + ">";
      }
      case type_kind::composite:
        return composite_name(type.composite_name(), ctx);
      default:
        break;
    }

    const auto* mapping = types_.find(kind_key(type));
    if (mapping == nullptr)
      throw codegen_error("no target type for '" + kind_key(type) + "'");
    return mapping->target_type;
  }

  std::string
  type_mapper::map_value(const type_expr& type,
                         const mapping_context& ctx) const {
    if (type.is_void()) return "enc.Empty";
    return map(type, ctx);
  }

  std::string
  type_mapper::composite_name(const type_id& id,
                              const mapping_context& ctx) const {
    if (api_.find(id) == nullptr)
      throw codegen_error("reference to unknown type '" + to_string(id) + "'");

    const auto& type_name = names_.public_name(id.name());
    const auto& type_ns = names_.public_name(id.namespace_name());
    bool foreign = id.namespace_name() != ctx.current_namespace;

    if (ctx.scope.contains(type_name) ||
        (foreign && ctx.scope.contains(type_ns)))
      return root_namespace_ + "." + type_ns + "." + type_name;
    if (foreign) return type_ns + "." + type_name;
    return type_name;
  }

  std::string
  type_mapper::variant_class_name(const union_type& u,
                                  const std::string& variant) const {
    auto name = names_.public_name(variant);
    const auto& owner = names_.public_name(u.name().name());
    if (name != owner) return name;

    std::set<std::string> taken{owner};
    for (const auto& f : u.fields())
      taken.insert(names_.public_name(f.name()));
    while (taken.count(name) != 0)
      name += "Variant";
    return name;
  }

  std::string
  type_mapper::literal_suffix(const type_expr& type) const {
    const auto& t = type.unwrap_nullable();
    if (!t.is_numeric()) return {};
    return types_.at(kind_key(t)).literal_suffix;
  }

  std::string
  type_mapper::literal(const type_expr& type, const std::string& value,
                       const mapping_context& ctx) const {
    const auto& t = type.unwrap_nullable();
    if (t.kind() == type_kind::boolean) {
      if (value != "true" && value != "false")
        throw codegen_error("'" + value + "' is not a Boolean literal");
      return value;
    }
    if (t.is_numeric()) return value + literal_suffix(t);
    if (t.is_string()) return verbatim_string(value);
    if (t.is_composite()) {
      const auto* u = api_.find_union(t.composite_name());
      if (u == nullptr)
        throw codegen_error("default on struct-typed reference to '" +
                            to_string(t.composite_name()) + "'");
      const auto* variant = u->find_field(value);
      if (variant == nullptr || !variant->is_void())
        throw codegen_error("default '" + value + "' is not a void variant of '" +
                            to_string(u->name()) + "'");
      return composite_name(u->name(), ctx) + "." +
             variant_class_name(*u, variant->name()) + ".Instance";
    }
    throw codegen_error("no literal form for a " +
                        (t.is_list() ? std::string("List") : kind_key(t)) +
                        " default");
  }

  bool
  type_mapper::could_be_null(const type_expr& type) const {
    return type.is_composite() || type.is_string() || type.is_list();
  }

  bool
  type_mapper::is_value_type(const type_expr& type) const {
    switch (type.kind()) {
      case type_kind::list:
      case type_kind::composite:
      case type_kind::nullable:
        return false;
      default:
        break;
    }
    const auto* mapping = types_.find(kind_key(type));
    return mapping != nullptr && mapping->value_type;
  }

  std::string
  verbatim_string(std::string_view text) {
    std::string result = "@\"";
    for (char c : text) {
      if (c == '"') result += '"';
      result += c;
    }
    result += '"';
    return result;
  }

} // namespace csb
