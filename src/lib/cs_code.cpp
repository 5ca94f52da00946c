#include <csb/cs_code.hpp>

#include <stdexcept>

namespace csb {

  cs_body&
  cs_body::line(const std::string& text) {
    if (text.empty()) {
      if (!lines_.empty() && !lines_.back().empty() &&
          lines_.back().back() != '{')
        lines_.emplace_back();
      return *this;
    }
    lines_.push_back(std::string(indent_ * 4, ' ') + text);
    return *this;
  }

  cs_body&
  cs_body::open(const std::string& header) {
    if (!header.empty()) line(header);
    line("{");
    ++indent_;
    return *this;
  }

  cs_body&
  cs_body::close() {
    if (indent_ == 0) throw std::logic_error("cs_body: unbalanced close");
    while (!lines_.empty() && lines_.back().empty()) lines_.pop_back();
    --indent_;
    line("}");
    return *this;
  }

  cs_body&
  cs_body::indent() {
    ++indent_;
    return *this;
  }

  cs_body&
  cs_body::dedent() {
    if (indent_ == 0) throw std::logic_error("cs_body: unbalanced dedent");
    --indent_;
    return *this;
  }

  std::string
  cs_body::str() const {
    std::size_t end = lines_.size();
    while (end > 0 && lines_[end - 1].empty()) --end;
    std::string result;
    for (std::size_t i = 0; i < end; ++i) {
      result += lines_[i];
      result += '\n';
    }
    return result;
  }

} // namespace csb
