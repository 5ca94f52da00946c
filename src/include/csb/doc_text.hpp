#pragma once

#include <csb/cs_code.hpp>

#include <string>
#include <string_view>

namespace csb {

  // <summary> for user documentation. Text is XML-escaped; a multi-line
  // text becomes one <para> per line.
  cs_doc
  summary_doc(std::string_view text);

  // <summary> holding generated markup, emitted as is.
  cs_doc
  markup_summary(const std::string& markup);

  // "Initializes a new instance of the <see cref="X" /> class."
  cs_doc
  constructor_doc(const std::string& class_name);

  void
  add_param(cs_doc& doc, const std::string& name, const std::string& markup);

  void
  add_element(cs_doc& doc, const std::string& tag, const std::string& markup);

  void
  add_seealso(cs_doc& doc, const std::string& cref);

  std::string
  see_cref(const std::string& cref);

} // namespace csb
