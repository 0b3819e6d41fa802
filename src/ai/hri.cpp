#include "gs1/ai/hri.hpp"

#include "gs1/core/common.hpp"

#include <cctype>
#include <utility>

namespace gs1::ai {

namespace {

[[nodiscard]] std::string to_upper(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

std::vector<std::string> render_hri(const ElementSequence& elements, bool include_titles) {
  std::vector<std::string> lines;
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    std::string line;
    if (include_titles && !e.entry->title.empty()) {
      line = to_upper(e.entry->title);
      line.push_back(' ');
    }
    line += "(" + e.ai + ") " + e.value;
    lines.push_back(std::move(line));
  }
  return lines;
}

std::optional<std::string> to_bracketed(const ElementSequence& elements) {
  if (elements.empty()) {
    return std::nullopt;
  }

  std::string out;
  for (const auto& e : elements) {
    switch (e.kind) {
      case ElementKind::ai_value:
        out += "(" + e.ai + ")";
        for (const char c : e.value) {
          if (c == '(') {
            out.push_back('\\');
          }
          out.push_back(c);
        }
        break;
      case ElementKind::composite_separator:
        out.push_back(core::kCompositeSeparator);
        break;
      case ElementKind::dl_ignored_param:
        break;
    }
  }
  return out;
}

std::vector<std::string> dl_ignored_query_params(const ElementSequence& elements) {
  std::vector<std::string> out;
  for (const auto& e : elements) {
    if (e.kind == ElementKind::dl_ignored_param) {
      out.push_back(e.value);
    }
  }
  return out;
}

}  // namespace gs1::ai
