#include <csb/constraints.hpp>

#include <csb/codegen_error.hpp>

#include <string>

namespace csb {

  namespace {

    std::string
    render(const range_check& check, const std::string& subject) {
      switch (check.kind) {
        case check_kind::min_value:
          return subject + " < " + check.operand;
        case check_kind::max_value:
          return subject + " > " + check.operand;
        case check_kind::min_length:
          return subject + ".Length < " + check.operand;
        case check_kind::max_length:
          return subject + ".Length > " + check.operand;
        case check_kind::pattern:
          return "!re.Regex.IsMatch(" + subject + ", " + check.operand + ")";
        case check_kind::min_items:
          return subject + ".Count < " + check.operand;
        case check_kind::max_items:
          return subject + ".Count > " + check.operand;
      }
      return {};
    }

    std::string
    unescaped(const std::string& arg) {
      return !arg.empty() && arg[0] == '@' ? arg.substr(1) : arg;
    }

    std::string
    unique_local(const std::string& base,
                 const std::set<std::string>& in_use) {
      std::string name = base;
      for (int n = 2; in_use.count(name) != 0; ++n)
        name = base + std::to_string(n);
      return name;
    }

  } // namespace

  std::string
  field_constraints::stored_value() const {
    if (list_copy_element) return list_local;
    return arg_name;
  }

  std::string
  field_constraints::condition() const {
    std::string subject = stored_value();
    std::string result;
    for (const auto& check : checks) {
      if (!result.empty()) result += " || ";
      result += render(check, subject);
    }
    return result;
  }

  field_constraints
  constraint_compiler::compile(const std::string& arg_name,
                               const std::string& display_name,
                               const type_expr& type,
                               const std::optional<std::string>& default_value,
                               const mapping_context& ctx,
                               const std::set<std::string>& locals_in_use) const {
    field_constraints c;
    c.arg_name = arg_name;
    c.display_name = display_name;

    bool nullable = type.is_nullable();
    const auto& t = type.unwrap_nullable();
    const auto& f = t.facets();

    if (t.is_numeric()) {
      auto suffix = mapper_.literal_suffix(t);
      if (f.min_value)
        c.checks.push_back({check_kind::min_value, *f.min_value + suffix});
      if (f.max_value)
        c.checks.push_back({check_kind::max_value, *f.max_value + suffix});
    } else if (t.is_string()) {
      if (f.min_length)
        c.checks.push_back(
            {check_kind::min_length, std::to_string(*f.min_length)});
      if (f.max_length)
        c.checks.push_back(
            {check_kind::max_length, std::to_string(*f.max_length)});
      if (f.pattern)
        c.checks.push_back({check_kind::pattern, verbatim_string(*f.pattern)});
    } else if (t.is_list()) {
      c.list_copy_element = mapper_.map(t.inner(), ctx);
      c.list_local = unique_local(unescaped(arg_name) + "List", locals_in_use);
      if (f.min_items)
        c.checks.push_back(
            {check_kind::min_items, std::to_string(*f.min_items)});
      if (f.max_items)
        c.checks.push_back(
            {check_kind::max_items, std::to_string(*f.max_items)});
    }

    if (default_value && t.is_composite()) {
      c.union_default = mapper_.literal(t, *default_value, ctx);
    } else if (nullable || (default_value && mapper_.could_be_null(t))) {
      c.present_guard = true;
    } else if (!default_value && mapper_.could_be_null(t)) {
      c.null_check = true;
    }
    return c;
  }

  field_constraints
  constraint_compiler::compile(const field& f, const mapping_context& ctx,
                               const std::set<std::string>& locals_in_use) const {
    const auto& arg = mapper_.names().arg_name(f.name());
    return compile(arg, unescaped(arg), f.type(), f.default_value(), ctx,
                   locals_in_use);
  }

  void
  constraint_compiler::emit(cs_body& body, const field_constraints& c) const {
    bool emitted = false;

    if (c.list_copy_element) {
      const auto& element = *c.list_copy_element;
      body.line("var " + c.list_local + " = new col.List<" + element +
                ">(" + c.arg_name + " ?? new " + element + "[0]);");
      body.line();
    }

    if (c.union_default) {
      body.open("if (" + c.arg_name + " == null)");
      body.line(c.arg_name + " = " + *c.union_default + ";");
      body.close();
      emitted = true;
    }

    std::string keyword = "if";
    if (c.null_check) {
      body.open("if (" + c.arg_name + " == null)");
      body.line("throw new sys.ArgumentNullException(\"" + c.display_name +
                "\");");
      body.close();
      keyword = "else if";
      emitted = true;
    }

    if (!c.checks.empty()) {
      std::string cond = c.condition();
      if (c.present_guard) cond = c.arg_name + " != null && (" + cond + ")";
      body.open(keyword + " (" + cond + ")");
      body.line("throw new sys.ArgumentOutOfRangeException(\"" +
                c.display_name + "\");");
      body.close();
      emitted = true;
    }

    if (emitted) body.line();
  }

  cs_parameter
  constraint_compiler::parameter(const field& f,
                                 const mapping_context& ctx) const {
    cs_parameter p;
    p.type = mapper_.map(f.type(), ctx, type_usage::parameter);
    p.name = mapper_.names().arg_name(f.name());
    if (f.has_default()) {
      if (f.type().unwrap_nullable().is_composite())
        p.default_value = "null";
      else
        p.default_value = mapper_.literal(f.type(), *f.default_value(), ctx);
    } else if (f.type().is_nullable()) {
      p.default_value = "null";
    }
    return p;
  }

  void
  constraint_compiler::emit_default(cs_body& body, const field& f,
                                    const std::string& target,
                                    const mapping_context& ctx) const {
    if (!f.has_default())
      throw codegen_error("field '" + f.name() + "' has no default");
    body.line(target + " = " +
              mapper_.literal(f.type(), *f.default_value(), ctx) + ";");
  }

} // namespace csb
