#include <csb/naming.hpp>

#include <unordered_set>

namespace csb {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    const std::unordered_set<std::string_view>&
    csharp_keywords() {
      static const std::unordered_set<std::string_view> keywords = {
          "abstract",   "add",       "alias",     "as",        "ascending",
          "async",      "await",     "base",      "bool",      "break",
          "byte",       "case",      "catch",     "char",      "checked",
          "class",      "const",     "continue",  "decimal",   "default",
          "delegate",   "descending", "do",       "double",    "dynamic",
          "else",       "enum",      "event",     "explicit",  "extern",
          "false",      "finally",   "fixed",     "float",     "for",
          "foreach",    "from",      "get",       "global",    "goto",
          "group",      "if",        "implicit",  "in",        "int",
          "interface",  "internal",  "into",      "is",        "join",
          "let",        "lock",      "long",      "namespace", "new",
          "null",       "object",    "operator",  "orderby",   "out",
          "override",   "params",    "partial",   "private",   "protected",
          "public",     "readonly",  "ref",       "remove",    "return",
          "sbyte",      "sealed",    "select",    "set",       "short",
          "sizeof",     "stackalloc", "static",   "string",    "struct",
          "switch",     "this",      "throw",     "true",      "try",
          "typeof",     "uint",      "ulong",     "unchecked", "unsafe",
          "ushort",     "using",     "value",     "var",       "virtual",
          "void",       "volatile",  "where",     "while",     "yield",
      };
      return keywords;
    }

    bool
    is_break(std::string_view name, std::size_t i) {
      if (i == 0 || !is_upper(name[i])) return false;
      char prev = name[i - 1];
      if (is_lower(prev) || is_digit(prev)) return true;
      return i + 1 < name.size() && is_lower(name[i + 1]);
    }

    std::string
    join_public(std::vector<std::string> words) {
      std::string result;
      for (auto& word : words) {
        word[0] = to_upper(word[0]);
        result += word;
      }
      if (!result.empty() && is_digit(result[0])) result.insert(0, 1, '_');
      return result;
    }

    std::string
    lower_first(std::string public_form) {
      if (public_form.empty()) return public_form;
      if (public_form[0] != '_') public_form[0] = to_lower(public_form[0]);
      if (is_reserved_word(public_form)) public_form.insert(0, 1, '@');
      return public_form;
    }

    std::string
    join_words(const std::vector<std::string>& words) {
      std::string result;
      for (const auto& word : words) {
        if (!result.empty()) result += ' ';
        result += word;
      }
      return result;
    }

  } // namespace

  std::vector<std::string>
  segment_name(std::string_view name) {
    std::vector<std::string> words;
    std::string current;
    auto flush = [&] {
      if (!current.empty()) words.push_back(std::move(current));
      current.clear();
    };

    for (std::size_t i = 0; i < name.size(); ++i) {
      char c = name[i];
      if (c == '/' || c == '_') {
        flush();
        continue;
      }
      if (is_break(name, i)) flush();
      current += to_lower(c);
    }
    flush();
    return words;
  }

  std::string
  public_name(std::string_view name) {
    return join_public(segment_name(name));
  }

  std::string
  arg_name(std::string_view name) {
    return lower_first(public_name(name));
  }

  std::string
  name_words(std::string_view name) {
    return join_words(segment_name(name));
  }

  bool
  is_reserved_word(std::string_view word) {
    return csharp_keywords().count(word) > 0;
  }

  const std::vector<std::string>&
  name_cache::segment(const std::string& name) {
    auto it = segments_.find(name);
    if (it == segments_.end())
      it = segments_.emplace(name, segment_name(name)).first;
    return it->second;
  }

  const std::string&
  name_cache::public_name(const std::string& name) {
    auto it = public_names_.find(name);
    if (it == public_names_.end())
      it = public_names_.emplace(name, join_public(segment(name))).first;
    return it->second;
  }

  const std::string&
  name_cache::arg_name(const std::string& name) {
    auto it = arg_names_.find(name);
    if (it == arg_names_.end())
      it = arg_names_.emplace(name, lower_first(public_name(name))).first;
    return it->second;
  }

  const std::string&
  name_cache::name_words(const std::string& name) {
    auto it = name_words_.find(name);
    if (it == name_words_.end())
      it = name_words_.emplace(name, join_words(segment(name))).first;
    return it->second;
  }

  name_scope
  name_scope::enter(std::vector<std::string> names) const {
    name_scope inner = *this;
    inner.frames_.push_back(std::move(names));
    return inner;
  }

  bool
  name_scope::contains(std::string_view name) const {
    for (const auto& frame : frames_) {
      for (const auto& n : frame) {
        if (n == name) return true;
      }
    }
    return false;
  }

} // namespace csb
