#pragma once

#include <csb/cs_code.hpp>
#include <csb/field.hpp>
#include <csb/type_mapper.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace csb {

  enum class check_kind {
    min_value,
    max_value,
    min_length,
    max_length,
    pattern,
    min_items,
    max_items,
  };

  // One out-of-range test. The operand is already a target literal.
  struct range_check {
    check_kind kind;
    std::string operand;

    bool
    operator==(const range_check&) const = default;
  };

  // Construction-time validation for one argument.
  struct field_constraints {
    std::string arg_name;
    std::string display_name;
    bool present_guard = false;
    bool null_check = false;
    std::optional<std::string> list_copy_element;
    std::string list_local;
    std::optional<std::string> union_default;
    std::vector<range_check> checks;

    // The expression assigned to the property: the defensive list copy for
    // lists, the argument otherwise.
    std::string
    stored_value() const;

    // The violation condition: every check joined with ||.
    std::string
    condition() const;

    bool
    operator==(const field_constraints&) const = default;
  };

  class constraint_compiler {
    const type_mapper& mapper_;

  public:
    explicit constraint_compiler(const type_mapper& mapper) : mapper_(mapper) {}

    // locals_in_use holds the identifiers already declared in the
    // constructor; the list copy local is chosen outside it.
    field_constraints
    compile(const std::string& arg_name, const std::string& display_name,
            const type_expr& type,
            const std::optional<std::string>& default_value,
            const mapping_context& ctx,
            const std::set<std::string>& locals_in_use = {}) const;

    // Errors name the C# parameter, without its @ escape.
    field_constraints
    compile(const field& f, const mapping_context& ctx,
            const std::set<std::string>& locals_in_use = {}) const;

    void
    emit(cs_body& body, const field_constraints& c) const;

    // Constructor parameter for a field, carrying its default when it has
    // one. Union defaults and nullable fields default to null.
    cs_parameter
    parameter(const field& f, const mapping_context& ctx) const;

    // target = <default>; for the zero-argument constructor.
    void
    emit_default(cs_body& body, const field& f, const std::string& target,
                 const mapping_context& ctx) const;
  };

} // namespace csb
