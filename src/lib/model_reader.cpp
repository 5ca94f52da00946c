#include <csb/model_reader.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace csb {

  namespace {

    bool
    is_whitespace(char c) {
      return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    bool
    is_whitespace_only(std::string_view sv) {
      return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_whitespace);
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    [[noreturn]] void
    fail(xml_reader& reader, const std::string& msg) {
      throw std::runtime_error("model_reader: line " +
                               std::to_string(reader.line()) + ": " + msg);
    }

    std::optional<std::string>
    opt_attr(xml_reader& reader, std::string_view name) {
      auto value = reader.find_attribute(name);
      if (!value) return std::nullopt;
      return std::string(*value);
    }

    std::string
    req_attr(xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value)
        fail(reader, "missing required attribute '" + std::string(name) +
                         "' on <" + reader.name() + ">");
      return *value;
    }

    bool
    bool_attr(xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value) return false;
      if (*value == "true") return true;
      if (*value == "false") return false;
      fail(reader, "attribute '" + std::string(name) + "' must be true or false");
    }

    std::optional<std::size_t>
    size_attr(xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value) return std::nullopt;
      if (value->empty() ||
          !std::all_of(value->begin(), value->end(),
                       [](char c) { return c >= '0' && c <= '9'; }))
        fail(reader, "attribute '" + std::string(name) +
                         "' must be a non-negative integer");
      return std::stoull(*value);
    }

    // Trims each line and drops leading and trailing blank lines.
    std::string
    normalize_doc(std::string_view text) {
      std::vector<std::string> lines;
      std::size_t start = 0;
      while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        while (!line.empty() && is_whitespace(line.front()))
          line.remove_prefix(1);
        while (!line.empty() && is_whitespace(line.back()))
          line.remove_suffix(1);
        lines.emplace_back(line);
        start = end + 1;
      }
      while (!lines.empty() && lines.back().empty()) lines.pop_back();
      std::size_t first = 0;
      while (first < lines.size() && lines[first].empty()) ++first;

      std::string result;
      for (std::size_t i = first; i < lines.size(); ++i) {
        if (i > first) result += '\n';
        result += lines[i];
      }
      return result;
    }

    // Reads the text of the current <doc> element and leaves the reader on
    // its end tag.
    std::string
    read_doc(xml_reader& reader) {
      std::size_t depth = reader.depth();
      std::string text;
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() == xml_node_type::characters)
          text += reader.text();
        else if (reader.node_type() == xml_node_type::start_element)
          fail(reader, "unexpected <" + reader.name() + "> inside <doc>");
      }
      return normalize_doc(text);
    }

    std::optional<type_kind>
    primitive_kind(std::string_view name) {
      static constexpr type_kind kinds[] = {
          type_kind::void_type, type_kind::boolean, type_kind::int32,
          type_kind::uint32,    type_kind::int64,   type_kind::uint64,
          type_kind::float32,   type_kind::float64, type_kind::string,
          type_kind::binary,    type_kind::timestamp,
      };
      for (auto k : kinds) {
        if (primitive_name(k) == name) return k;
      }
      return std::nullopt;
    }

    type_id
    parse_type_id(const std::string& text, const std::string& current_ns) {
      auto dot = text.rfind('.');
      if (dot == std::string::npos) return type_id(current_ns, text);
      return type_id(text.substr(0, dot), text.substr(dot + 1));
    }

    facet_set
    parse_facets(xml_reader& reader) {
      facet_set f;
      f.min_value = opt_attr(reader, "min-value");
      f.max_value = opt_attr(reader, "max-value");
      f.min_length = size_attr(reader, "min-length");
      f.max_length = size_attr(reader, "max-length");
      f.pattern = opt_attr(reader, "pattern");
      f.min_items = size_attr(reader, "min-items");
      f.max_items = size_attr(reader, "max-items");
      return f;
    }

    struct member_body {
      type_expr type;
      std::string doc;
    };

    // Parses the type attributes of a <field> or <item> and consumes its
    // children (<doc>, and <item> for lists). Leaves the reader on the end
    // tag of the element.
    member_body
    parse_member(xml_reader& reader, const std::string& current_ns,
                 std::optional<std::string> default_type) {
      auto type_name = opt_attr(reader, "type");
      if (!type_name) type_name = default_type;
      if (!type_name)
        fail(reader, "missing required attribute 'type' on <" +
                         reader.name() + ">");
      bool nullable = bool_attr(reader, "nullable");
      facet_set facets = parse_facets(reader);
      std::size_t line = reader.line();
      std::string element = reader.name();

      member_body body;
      std::optional<type_expr> item;
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() != xml_node_type::start_element) continue;
        if (reader.name() == "doc") {
          body.doc = read_doc(reader);
        } else if (reader.name() == "item") {
          if (item) fail(reader, "more than one <item> in <" + element + ">");
          item = parse_member(reader, current_ns, std::nullopt).type;
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <" + element +
                           ">");
        }
      }

      auto where = [&] {
        return "model_reader: line " + std::to_string(line) + ": ";
      };

      if (*type_name == "List") {
        if (!item)
          throw std::runtime_error(where() + "List type needs an <item>");
        body.type = type_expr::list_of(std::move(*item), std::move(facets));
      } else {
        if (item)
          throw std::runtime_error(where() + "<item> is only valid for List");
        if (auto kind = primitive_kind(*type_name)) {
          body.type = type_expr(*kind, std::move(facets));
        } else {
          if (!facets.empty())
            throw std::runtime_error(where() + "facets on composite type '" +
                                     *type_name + "'");
          body.type =
              type_expr::reference_to(parse_type_id(*type_name, current_ns));
        }
      }

      if (nullable) {
        if (body.type.is_void())
          throw std::runtime_error(where() + "Void cannot be nullable");
        body.type = type_expr::nullable_of(std::move(body.type));
      }
      return body;
    }

    field
    parse_field(xml_reader& reader, const std::string& current_ns) {
      auto name = req_attr(reader, "name");
      auto default_value = opt_attr(reader, "default");
      auto body = parse_member(reader, current_ns, std::nullopt);
      return field(std::move(name), std::move(body.type),
                   std::move(default_value), std::move(body.doc));
    }

    union_field
    parse_union_field(xml_reader& reader, const std::string& current_ns) {
      auto name = req_attr(reader, "name");
      if (reader.find_attribute("default"))
        fail(reader, "union variant '" + name + "' cannot have a default");
      auto body = parse_member(reader, current_ns, std::string("Void"));
      return union_field(std::move(name), std::move(body.type),
                         std::move(body.doc));
    }

    std::vector<subtype_ref>
    parse_subtypes(xml_reader& reader, const std::string& current_ns) {
      std::vector<subtype_ref> result;
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() != xml_node_type::start_element) continue;
        if (reader.name() != "subtype")
          fail(reader, "unexpected <" + reader.name() + "> in <subtypes>");
        auto type = parse_type_id(req_attr(reader, "type"), current_ns);
        auto tag = opt_attr(reader, "tag").value_or(type.name());
        result.push_back({std::move(tag), std::move(type)});
      }
      return result;
    }

    struct_type
    parse_struct(xml_reader& reader, const std::string& current_ns) {
      type_id name(current_ns, req_attr(reader, "name"));
      std::optional<type_id> parent;
      if (auto ext = opt_attr(reader, "extends"))
        parent = parse_type_id(*ext, current_ns);
      bool catch_all = bool_attr(reader, "catch-all");

      std::string doc;
      std::vector<field> fields;
      std::vector<subtype_ref> subtypes;
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() != xml_node_type::start_element) continue;
        const auto& local = reader.name();
        if (local == "doc") {
          doc = read_doc(reader);
        } else if (local == "field") {
          fields.push_back(parse_field(reader, current_ns));
        } else if (local == "subtypes") {
          auto more = parse_subtypes(reader, current_ns);
          subtypes.insert(subtypes.end(), more.begin(), more.end());
        } else {
          fail(reader, "unexpected <" + local + "> in struct '" +
                           name.name() + "'");
        }
      }
      return struct_type(std::move(name), std::move(fields), std::move(parent),
                         std::move(subtypes), catch_all, std::move(doc));
    }

    union_type
    parse_union(xml_reader& reader, const std::string& current_ns) {
      type_id name(current_ns, req_attr(reader, "name"));
      auto catch_all = opt_attr(reader, "catch-all");

      std::string doc;
      std::vector<union_field> fields;
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() != xml_node_type::start_element) continue;
        const auto& local = reader.name();
        if (local == "doc") {
          doc = read_doc(reader);
        } else if (local == "field") {
          fields.push_back(parse_union_field(reader, current_ns));
        } else {
          fail(reader, "unexpected <" + local + "> in union '" + name.name() +
                           "'");
        }
      }
      return union_type(std::move(name), std::move(fields),
                        std::move(catch_all), std::move(doc));
    }

    namespace_def
    parse_namespace(xml_reader& reader) {
      namespace_def ns(req_attr(reader, "name"));
      std::size_t depth = reader.depth();
      while (read_skip_ws(reader)) {
        if (reader.node_type() == xml_node_type::end_element &&
            reader.depth() == depth)
          break;
        if (reader.node_type() != xml_node_type::start_element) continue;
        const auto& local = reader.name();
        if (local == "doc") {
          ns.set_doc(read_doc(reader));
        } else if (local == "struct") {
          ns.add(parse_struct(reader, ns.name()));
        } else if (local == "union") {
          ns.add(parse_union(reader, ns.name()));
        } else {
          fail(reader, "unexpected <" + local + "> in namespace '" +
                           ns.name() + "'");
        }
      }
      return ns;
    }

  } // namespace

  std::vector<namespace_def>
  model_reader::parse(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != "api") {
      throw std::runtime_error("model_reader: expected <api> root element");
    }

    std::vector<namespace_def> result;
    std::size_t root_depth = reader.depth();
    while (read_skip_ws(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.depth() == root_depth)
        break;
      if (reader.node_type() != xml_node_type::start_element) continue;
      if (reader.name() != "namespace")
        fail(reader, "unexpected <" + reader.name() + "> in <api>");
      result.push_back(parse_namespace(reader));
    }
    return result;
  }

} // namespace csb
