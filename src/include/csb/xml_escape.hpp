#pragma once

#include <string>
#include <string_view>

namespace csb {

  inline std::string
  escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
      switch (c) {
        case '<':
          out += "&lt;";
          break;
        case '>':
          out += "&gt;";
          break;
        case '&':
          out += "&amp;";
          break;
        default:
          out += c;
          break;
      }
    }
    return out;
  }

  inline std::string
  escape_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
      if (c == '"')
        out += "&quot;";
      else
        out += escape_text(std::string_view(&c, 1));
    }
    return out;
  }

} // namespace csb
