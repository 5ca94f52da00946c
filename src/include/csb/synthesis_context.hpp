#pragma once

#include <csb/api.hpp>
#include <csb/cs_code.hpp>
#include <csb/hierarchy.hpp>
#include <csb/type_mapper.hpp>

#include <string>

namespace csb {

  // Collaborators shared by the synthesizers for one namespace of one run.
  struct synthesis_context {
    const api& model;
    const type_mapper& mapper;
    hierarchy_resolver& hierarchy;
    const related_map& related;
  };

  // Type summary: the schema doc, or "The <words> object".
  cs_doc
  type_doc(const std::string& doc, const std::string& words);

  // Explicit enc.IEncodable<T>.Encode implementation.
  cs_method
  encode_method(const std::string& class_name, const cs_body& body);

  // Explicit enc.IEncodable<T>.Decode implementation.
  cs_method
  decode_method(const std::string& class_name, const cs_body& body);

  // A local variable name for a schema name that cannot shadow the
  // identifiers encode and decode bodies declare (tag, obj, encoder,
  // decoder).
  std::string
  local_name(name_cache& names, const std::string& schema_name);

  std::string
  invalid_state(const std::string& message_expression);

} // namespace csb
