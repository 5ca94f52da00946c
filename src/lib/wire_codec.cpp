#include <csb/wire_codec.hpp>

namespace csb {

  std::string
  wire_codec::string_literal(const std::string& text) {
    std::string result = "\"";
    for (char c : text) {
      if (c == '"' || c == '\\') result += '\\';
      result += c;
    }
    result += '"';
    return result;
  }

  std::string
  wire_codec::tag_statement(const std::string& tag) {
    return std::string("obj.AddField<string>(\"") + tag_entry + "\", " +
           string_literal(tag) + ");";
  }

  std::string
  wire_codec::add_statement(const type_expr& type, const std::string& wire_name,
                            const std::string& value,
                            const mapping_context& ctx) const {
    const auto& t = type.unwrap_nullable();
    if (t.is_list()) {
      const auto& element = t.inner();
      auto element_type = mapper_.map(element, ctx);
      std::string method = element.unwrap_nullable().is_composite()
                               ? "AddFieldObjectList"
                               : "AddFieldList";
      return "obj." + method + "<" + element_type + ">(" + string_literal(wire_name) +
             ", " + value + ");";
    }
    auto value_type = mapper_.map(t, ctx);
    if (t.is_composite())
      return "obj.AddFieldObject<" + value_type + ">(" + string_literal(wire_name) +
             ", " + value + ");";
    return "obj.AddField<" + value_type + ">(" + string_literal(wire_name) + ", " +
           value + ");";
  }

  std::string
  wire_codec::get_expression(const type_expr& type,
                             const std::string& wire_name,
                             const mapping_context& ctx) const {
    const auto& t = type.unwrap_nullable();
    if (t.is_list()) {
      const auto& element = t.inner();
      auto element_type = mapper_.map(element, ctx);
      std::string method = element.unwrap_nullable().is_composite()
                               ? "GetFieldObjectList"
                               : "GetFieldList";
      return "new col.List<" + element_type + ">(obj." + method + "<" +
             element_type + ">(" + string_literal(wire_name) + "))";
    }
    std::string method = t.is_composite() ? "GetFieldObject" : "GetField";
    return "obj." + method + "<" + mapper_.map(t, ctx) + ">(" +
           string_literal(wire_name) + ")";
  }

  void
  wire_codec::emit_encode(cs_body& body, const field& f,
                          const mapping_context& ctx) const {
    const auto& property = mapper_.names().public_name(f.name());
    const auto& t = f.type().unwrap_nullable();
    std::string value = "this." + property;

    if (t.is_list()) {
      body.open("if (" + value + ".Count > 0)");
      body.line(add_statement(t, f.name(), value, ctx));
      body.close();
      return;
    }

    if (f.type().is_nullable()) {
      body.open("if (" + value + " != null)");
      if (mapper_.is_value_type(t)) value += ".Value";
      body.line(add_statement(t, f.name(), value, ctx));
      body.close();
      return;
    }

    body.line(add_statement(t, f.name(), value, ctx));
  }

  void
  wire_codec::emit_decode(cs_body& body, const field& f,
                          const mapping_context& ctx) const {
    const auto& property = mapper_.names().public_name(f.name());
    const auto& t = f.type().unwrap_nullable();
    std::string assign =
        "this." + property + " = " + get_expression(t, f.name(), ctx) + ";";

    if (!f.type().is_nullable() && !f.has_default() && !t.is_list()) {
      body.line(assign);
      return;
    }

    body.open("if (obj.HasField(" + string_literal(f.name()) + "))");
    body.line(assign);
    body.close();
    if (t.is_list()) {
      body.open("else");
      body.line("this." + property + " = new col.List<" +
                mapper_.map(t.inner(), ctx) + ">();");
      body.close();
    }
  }

} // namespace csb
