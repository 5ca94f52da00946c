#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace csb {

  // Splits a schema name into lowercase words. Breaks on '/' and '_', before
  // an uppercase letter that follows a lowercase letter or digit, and before
  // an uppercase letter (other than the first) that precedes a lowercase one.
  // Empty words are dropped.
  std::vector<std::string>
  segment_name(std::string_view name);

  // FooBar form, used for types, properties and namespaces.
  std::string
  public_name(std::string_view name);

  // fooBar form, used for parameters and locals. Reserved words get the
  // verbatim '@' prefix.
  std::string
  arg_name(std::string_view name);

  // "foo bar" form, used in generated documentation.
  std::string
  name_words(std::string_view name);

  bool
  is_reserved_word(std::string_view word);

  // Memoizes the name transforms for one generation run. Not shared between
  // runs or threads.
  class name_cache {
    std::unordered_map<std::string, std::vector<std::string>> segments_;
    std::unordered_map<std::string, std::string> public_names_;
    std::unordered_map<std::string, std::string> arg_names_;
    std::unordered_map<std::string, std::string> name_words_;

  public:
    const std::vector<std::string>&
    segment(const std::string& name);

    const std::string&
    public_name(const std::string& name);

    const std::string&
    arg_name(const std::string& name);

    const std::string&
    name_words(const std::string& name);

    std::size_t
    size() const {
      return segments_.size();
    }
  };

  // Names declared by the constructs enclosing the code being generated.
  // Entering a construct yields a new scope; the enclosing one is unchanged.
  class name_scope {
    std::vector<std::vector<std::string>> frames_;

  public:
    name_scope() = default;

    name_scope
    enter(std::vector<std::string> names) const;

    bool
    contains(std::string_view name) const;

    std::size_t
    depth() const {
      return frames_.size();
    }
  };

} // namespace csb
