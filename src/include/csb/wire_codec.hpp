#pragma once

#include <csb/cs_code.hpp>
#include <csb/field.hpp>
#include <csb/type_mapper.hpp>

#include <string>

namespace csb {

  // Name of the reserved entry holding a tagged value's tag.
  inline constexpr const char* tag_entry = ".tag";

  // Statements that move field values between generated objects and the
  // runtime's object encoder (obj) and decoder (obj).
  class wire_codec {
    const type_mapper& mapper_;

  public:
    explicit wire_codec(const type_mapper& mapper) : mapper_(mapper) {}

    // obj.AddField...("name", value); for a value that is known to be
    // present.
    std::string
    add_statement(const type_expr& type, const std::string& wire_name,
                  const std::string& value, const mapping_context& ctx) const;

    // obj.GetField...("name"), lists wrapped in a fresh col.List.
    std::string
    get_expression(const type_expr& type, const std::string& wire_name,
                   const mapping_context& ctx) const;

    // Encodes this.<Field>. Absent nullable values and empty lists are not
    // written.
    void
    emit_encode(cs_body& body, const field& f,
                const mapping_context& ctx) const;

    // Decodes into this.<Field>. Optional entries are read only when
    // present; a missing list becomes an empty list.
    void
    emit_decode(cs_body& body, const field& f,
                const mapping_context& ctx) const;

    static std::string
    tag_statement(const std::string& tag);

    // A regular C# string literal.
    static std::string
    string_literal(const std::string& text);
  };

} // namespace csb
