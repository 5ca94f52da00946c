#include <csb/doc_text.hpp>

#include <csb/xml_escape.hpp>

#include <vector>

namespace csb {

  namespace {

    std::vector<std::string_view>
    split_lines(std::string_view text) {
      std::vector<std::string_view> lines;
      std::size_t start = 0;
      while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
      }
      return lines;
    }

  } // namespace

  cs_doc
  summary_doc(std::string_view text) {
    auto lines = split_lines(text);
    if (lines.size() <= 1) return markup_summary(escape_text(text));

    cs_doc doc;
    doc.lines.push_back("<summary>");
    for (auto line : lines)
      doc.lines.push_back("<para>" + escape_text(line) + "</para>");
    doc.lines.push_back("</summary>");
    return doc;
  }

  cs_doc
  markup_summary(const std::string& markup) {
    cs_doc doc;
    doc.lines.push_back("<summary>" + markup + "</summary>");
    return doc;
  }

  cs_doc
  constructor_doc(const std::string& class_name) {
    return markup_summary("Initializes a new instance of the " +
                          see_cref(class_name) + " class.");
  }

  void
  add_param(cs_doc& doc, const std::string& name, const std::string& markup) {
    doc.lines.push_back("<param name=\"" + escape_attribute(name) + "\">" +
                        markup + "</param>");
  }

  void
  add_element(cs_doc& doc, const std::string& tag, const std::string& markup) {
    doc.lines.push_back("<" + tag + ">" + markup + "</" + tag + ">");
  }

  void
  add_seealso(cs_doc& doc, const std::string& cref) {
    doc.lines.push_back("<seealso cref=\"" + escape_attribute(cref) +
                        "\" />");
  }

  std::string
  see_cref(const std::string& cref) {
    return "<see cref=\"" + escape_attribute(cref) + "\" />";
  }

} // namespace csb
