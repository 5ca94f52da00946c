#include <csb/type_map.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace csb {

  type_map
  type_map::defaults() {
    type_map map;

    map.set("Void", {"void", "", false});
    map.set("Boolean", {"bool", "", true});

    // Numeric kinds carry the suffix that types their literals
    map.set("Int32", {"int", "", true});
    map.set("UInt32", {"uint", "U", true});
    map.set("Int64", {"long", "L", true});
    map.set("UInt64", {"ulong", "UL", true});
    map.set("Float32", {"float", "F", true});
    map.set("Float64", {"double", "D", true});

    map.set("String", {"string", "", false});
    map.set("Binary", {"byte[]", "", false});
    map.set("Timestamp", {"sys.DateTime", "", true});

    return map;
  }

  namespace {

    bool
    is_whitespace_only(std::string_view sv) {
      return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
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

    std::string
    required(xml_reader& reader, std::string_view name) {
      auto value = reader.find_attribute(name);
      if (!value || value->empty()) {
        throw std::runtime_error("type_map::load: line " +
                                 std::to_string(reader.line()) +
                                 ": <mapping> needs a '" + std::string(name) +
                                 "' attribute");
      }
      return std::string(*value);
    }

  } // namespace

  type_map
  type_map::load(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != "typemap") {
      throw std::runtime_error(
          "type_map::load: expected <typemap> root element");
    }

    const auto known = defaults();
    type_map result;

    while (read_skip_ws(reader)) {
      if (reader.node_type() == xml_node_type::end_element &&
          reader.name() == "typemap") {
        break;
      }

      if (reader.node_type() != xml_node_type::start_element ||
          reader.name() != "mapping") {
        throw std::runtime_error(
            "type_map::load: unexpected element inside <typemap>");
      }

      auto kind_name = required(reader, "type");
      if (!known.contains(kind_name)) {
        throw std::runtime_error("type_map::load: unknown type '" + kind_name +
                                 "'");
      }

      type_mapping mapping;
      mapping.target_type = required(reader, "target");
      mapping.literal_suffix =
          std::string(reader.find_attribute("suffix").value_or(""));
      mapping.value_type =
          reader.find_attribute("value-type").value_or("false") == "true";

      result.set(std::move(kind_name), std::move(mapping));

      // Advance past end_element for this mapping
      read_skip_ws(reader);
    }

    return result;
  }

  void
  type_map::merge(const type_map& overrides) {
    for (const auto& [kind_name, mapping] : overrides.entries_) {
      if (entries_.find(kind_name) == entries_.end()) {
        throw std::runtime_error(
            "type_map::merge: cannot override unknown type '" + kind_name +
            "'");
      }
      entries_[kind_name] = mapping;
    }
  }

  const type_mapping*
  type_map::find(const std::string& kind_name) const {
    auto it = entries_.find(kind_name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  const type_mapping&
  type_map::at(const std::string& kind_name) const {
    const auto* mapping = find(kind_name);
    if (mapping == nullptr)
      throw std::runtime_error("type_map: no mapping for '" + kind_name + "'");
    return *mapping;
  }

  void
  type_map::set(std::string kind_name, type_mapping mapping) {
    entries_.insert_or_assign(std::move(kind_name), std::move(mapping));
  }

  std::size_t
  type_map::size() const {
    return entries_.size();
  }

  bool
  type_map::contains(const std::string& kind_name) const {
    return entries_.count(kind_name) != 0;
  }

} // namespace csb
