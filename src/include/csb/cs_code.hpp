#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace csb {

  // Lines of a /// comment, without the marker.
  struct cs_doc {
    std::vector<std::string> lines;

    bool
    empty() const {
      return lines.empty();
    }

    bool
    operator==(const cs_doc&) const = default;
  };

  struct cs_parameter {
    std::string type;
    std::string name;
    std::string default_value;

    bool
    operator==(const cs_parameter&) const = default;
  };

  struct cs_constructor {
    cs_doc doc;
    std::string access;
    std::string name;
    std::vector<cs_parameter> parameters;
    std::vector<std::string> base_arguments;
    std::string body;

    bool
    operator==(const cs_constructor&) const = default;
  };

  // Auto-property when getter_body is empty, otherwise a get-only property
  // with a block body.
  struct cs_property {
    cs_doc doc;
    std::string access;
    std::string type;
    std::string name;
    std::string setter_access;
    std::string getter_body;

    bool
    operator==(const cs_property&) const = default;
  };

  struct cs_field {
    cs_doc doc;
    std::string modifiers;
    std::string type;
    std::string name;
    std::string initializer;

    bool
    operator==(const cs_field&) const = default;
  };

  struct cs_method {
    cs_doc doc;
    std::vector<std::string> attributes;
    std::string modifiers;
    std::string return_type;
    std::string name;
    std::vector<cs_parameter> parameters;
    std::string body;

    bool
    operator==(const cs_method&) const = default;
  };

  struct cs_region {
    std::string label;
    std::vector<cs_method> methods;

    bool
    operator==(const cs_region&) const = default;
  };

  using cs_member =
      std::variant<cs_constructor, cs_property, cs_field, cs_method, cs_region>;

  struct cs_class {
    cs_doc doc;
    std::string access;
    std::string name;
    std::vector<std::string> bases;
    std::vector<cs_member> members;
    std::vector<cs_class> nested;
  };

  struct cs_using {
    std::string alias;
    std::string target;

    bool
    operator==(const cs_using&) const = default;
  };

  // One emission unit: a single top-level type in its own file.
  struct cs_file {
    std::string path;
    std::string namespace_name;
    std::string generator;
    std::vector<std::vector<cs_using>> usings;
    cs_class type;
  };

  struct cs_doc_member {
    std::string name;
    cs_doc doc;

    bool
    operator==(const cs_doc_member&) const = default;
  };

  // XML documentation file with one member per documented namespace, the
  // root namespace first. Member names carry the N: prefix.
  struct cs_doc_file {
    std::string path;
    std::string assembly;
    std::vector<cs_doc_member> members;
  };

  // Statement text for a member body. Blocks use Allman braces and
  // four-space indentation relative to the body.
  class cs_body {
    std::vector<std::string> lines_;
    std::size_t indent_ = 0;

  public:
    // Appends one statement line. An empty line is a separator; repeated
    // separators collapse.
    cs_body&
    line(const std::string& text = {});

    // Emits header (if any) and an opening brace, then indents.
    cs_body&
    open(const std::string& header = {});

    cs_body&
    close();

    cs_body&
    indent();

    cs_body&
    dedent();

    bool
    empty() const {
      return lines_.empty();
    }

    std::size_t
    depth() const {
      return indent_;
    }

    // The body text, one line per statement, without trailing separators.
    std::string
    str() const;
  };

} // namespace csb
