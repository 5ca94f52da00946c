#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace csb {

  // Declared constraints on a primitive or list type. Numeric bounds keep
  // their schema spelling so they can be emitted as literals unchanged.
  struct facet_set {
    std::optional<std::string> min_value;
    std::optional<std::string> max_value;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::string> pattern;
    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;

    bool
    empty() const {
      return !min_value && !max_value && !min_length && !max_length &&
             !pattern && !min_items && !max_items;
    }

    bool
    operator==(const facet_set&) const = default;
  };

} // namespace csb
