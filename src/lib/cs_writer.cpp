#include <csb/cs_writer.hpp>

#include <csb/xml_escape.hpp>

#include <sstream>
#include <string_view>
#include <type_traits>
#include <variant>

namespace csb {

  namespace {

    // Parameter lists longer than this wrap one parameter per line
    constexpr std::size_t max_signature_width = 100;

    std::string
    pad(std::size_t level) {
      return std::string(level * 4, ' ');
    }

    void
    write_doc(std::ostream& os, const cs_doc& doc, std::size_t level) {
      for (const auto& line : doc.lines)
        os << pad(level) << "/// " << line << '\n';
    }

    // Writes a body with every non-empty line indented to level.
    void
    write_block(std::ostream& os, const std::string& body, std::size_t level) {
      os << pad(level) << "{\n";
      std::string_view rest = body;
      while (!rest.empty()) {
        auto end = rest.find('\n');
        auto line = rest.substr(0, end);
        if (!line.empty()) os << pad(level + 1) << line;
        os << '\n';
        if (end == std::string_view::npos) break;
        rest.remove_prefix(end + 1);
      }
      os << pad(level) << "}\n";
    }

    std::string
    parameter_text(const cs_parameter& p) {
      std::string text = p.type + ' ' + p.name;
      if (!p.default_value.empty()) text += " = " + p.default_value;
      return text;
    }

    // "head(a, b)" on one line, or aligned under the open paren when long.
    void
    write_signature(std::ostream& os, const std::string& head,
                    const std::vector<cs_parameter>& params,
                    std::size_t level) {
      std::string single = head + '(';
      for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) single += ", ";
        single += parameter_text(params[i]);
      }
      single += ')';

      if (params.size() < 2 ||
          pad(level).size() + single.size() <= max_signature_width) {
        os << pad(level) << single << '\n';
        return;
      }

      std::string align(head.size() + 1, ' ');
      os << pad(level) << head << '(';
      for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) os << ",\n" << pad(level) << align;
        os << parameter_text(params[i]);
      }
      os << ")\n";
    }

    void
    write_constructor(std::ostream& os, const cs_constructor& c,
                      std::size_t level) {
      write_doc(os, c.doc, level);
      write_signature(os, c.access + ' ' + c.name, c.parameters, level);
      if (!c.base_arguments.empty()) {
        os << pad(level + 1) << ": base(";
        for (std::size_t i = 0; i < c.base_arguments.size(); ++i) {
          if (i > 0) os << ", ";
          os << c.base_arguments[i];
        }
        os << ")\n";
      }
      write_block(os, c.body, level);
    }

    void
    write_property(std::ostream& os, const cs_property& p, std::size_t level) {
      write_doc(os, p.doc, level);
      std::string head = p.access + ' ' + p.type + ' ' + p.name;
      if (p.getter_body.empty()) {
        os << pad(level) << head << " { get; ";
        if (!p.setter_access.empty()) os << p.setter_access << ' ';
        os << "set; }\n";
        return;
      }
      os << pad(level) << head << '\n';
      os << pad(level) << "{\n";
      os << pad(level + 1) << "get\n";
      write_block(os, p.getter_body, level + 1);
      os << pad(level) << "}\n";
    }

    void
    write_field(std::ostream& os, const cs_field& f, std::size_t level) {
      write_doc(os, f.doc, level);
      os << pad(level) << f.modifiers << ' ' << f.type << ' ' << f.name;
      if (!f.initializer.empty()) os << " = " << f.initializer;
      os << ";\n";
    }

    void
    write_method(std::ostream& os, const cs_method& m, std::size_t level) {
      write_doc(os, m.doc, level);
      for (const auto& attr : m.attributes)
        os << pad(level) << '[' << attr << "]\n";
      std::string head;
      if (!m.modifiers.empty()) head = m.modifiers + ' ';
      head += m.return_type + ' ' + m.name;
      write_signature(os, head, m.parameters, level);
      write_block(os, m.body, level);
    }

    void
    write_region(std::ostream& os, const cs_region& r, std::size_t level) {
      os << pad(level) << "#region " << r.label << "\n\n";
      for (std::size_t i = 0; i < r.methods.size(); ++i) {
        if (i > 0) os << '\n';
        write_method(os, r.methods[i], level);
      }
      os << '\n' << pad(level) << "#endregion\n";
    }

    void
    write_class(std::ostream& os, const cs_class& c, std::size_t level) {
      write_doc(os, c.doc, level);
      os << pad(level);
      if (!c.access.empty()) os << c.access << ' ';
      os << "class " << c.name;
      for (std::size_t i = 0; i < c.bases.size(); ++i)
        os << (i == 0 ? " : " : ", ") << c.bases[i];
      os << '\n' << pad(level) << "{\n";

      bool first = true;
      auto separate = [&] {
        if (!first) os << '\n';
        first = false;
      };

      for (const auto& member : c.members) {
        separate();
        std::visit(
            [&os, level](const auto& m) {
              using T = std::decay_t<decltype(m)>;
              if constexpr (std::is_same_v<T, cs_constructor>) {
                write_constructor(os, m, level + 1);
              } else if constexpr (std::is_same_v<T, cs_property>) {
                write_property(os, m, level + 1);
              } else if constexpr (std::is_same_v<T, cs_field>) {
                write_field(os, m, level + 1);
              } else if constexpr (std::is_same_v<T, cs_method>) {
                write_method(os, m, level + 1);
              } else if constexpr (std::is_same_v<T, cs_region>) {
                write_region(os, m, level + 1);
              }
            },
            member);
      }

      for (const auto& inner : c.nested) {
        separate();
        write_class(os, inner, level + 1);
      }

      os << pad(level) << "}\n";
    }

  } // namespace

  std::string
  cs_writer::write(const cs_file& file) const {
    std::ostringstream os;
    os << "// <auto-generated>\n";
    os << "// Auto-generated by " << file.generator << ", do not modify.\n";
    os << "// </auto-generated>\n\n";

    os << "namespace " << file.namespace_name << '\n' << "{\n";
    for (const auto& group : file.usings) {
      if (group.empty()) continue;
      for (const auto& u : group)
        os << pad(1) << "using " << u.alias << " = " << u.target << ";\n";
      os << '\n';
    }
    write_class(os, file.type, 1);
    os << "}\n";
    return os.str();
  }

  std::string
  cs_writer::write(const cs_doc_file& file) const {
    std::ostringstream os;
    os << "<?xml version=\"1.0\"?>\n";
    os << "<doc>\n";
    os << pad(1) << "<assembly>\n";
    os << pad(2) << "<name>" << escape_text(file.assembly) << "</name>\n";
    os << pad(1) << "</assembly>\n";
    os << pad(1) << "<members>\n";
    for (const auto& member : file.members) {
      os << pad(2) << "<member name=\"" << escape_attribute(member.name)
         << "\">\n";
      for (const auto& line : member.doc.lines)
        os << pad(3) << line << '\n';
      os << pad(2) << "</member>\n";
    }
    os << pad(1) << "</members>\n";
    os << "</doc>\n";
    return os.str();
  }

} // namespace csb
