#include "gs1/dict/syntax_dictionary.hpp"

#include "gs1/core/common.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <set>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace gs1::dict {

namespace {

class DictErrorCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "gs1.dict"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::cannot_read_file:
        return "cannot read syntax dictionary file";
      case errc::invalid_ai:
        return "invalid AI in syntax dictionary";
      case errc::invalid_ai_range:
        return "invalid AI range in syntax dictionary";
      case errc::missing_components:
        return "AI is missing components";
      case errc::invalid_component:
        return "invalid component specification";
      case errc::unknown_linter:
        return "unknown linter";
      case errc::ambiguous_components:
        return "ambiguous component specification";
      case errc::invalid_attribute:
        return "invalid attribute";
      case errc::invalid_title:
        return "invalid title";
      case errc::prefix_length_conflict:
        return "AIs sharing a prefix have different lengths";
      case errc::duplicate_ai:
        return "duplicate AI in syntax dictionary";
      case errc::empty_dictionary:
        return "syntax dictionary defines no AIs";
    }
    return "unknown gs1.dict error";
  }
};

const DictErrorCategory kDictErrorCategory{};

constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kFlagCharacters = "*?!\"$%&'()+,-./:;<=>@[\\]^_`{|}~";
constexpr std::string_view kAttrNameCharacters = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kAttrValueCharacters =
    "abcdefghijklmnopqrstuvwxyz0123456789-+_,|";
constexpr std::string_view kTitleCharacters =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789#()-+,./ ";

[[nodiscard]] std::vector<std::string> split(std::string_view s, char sep) {
  std::vector<std::string> out;
  for (;;) {
    const auto pos = s.find(sep);
    out.emplace_back(s.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    s.remove_prefix(pos + 1);
  }
  return out;
}

[[nodiscard]] bool only_of(std::string_view s, std::string_view charset) noexcept {
  return s.find_first_not_of(charset) == std::string_view::npos;
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string_view::npos) {
    return {};
  }
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

/**
 * @brief 以空白切分一行，并能取得当前位置之后的剩余文本（用于标题）。
 */
class LineTokenizer {
 public:
  explicit LineTokenizer(std::string_view line) noexcept : line_(line) {}

  std::optional<std::string_view> next() noexcept {
    const auto b = line_.find_first_not_of(" \t", pos_);
    if (b == std::string_view::npos) {
      pos_ = line_.size();
      return std::nullopt;
    }
    auto e = line_.find_first_of(" \t", b);
    if (e == std::string_view::npos) {
      e = line_.size();
    }
    pos_ = e;
    return line_.substr(b, e - b);
  }

  [[nodiscard]] std::string_view rest() const noexcept {
    return line_.substr(pos_);
  }

 private:
  std::string_view line_;
  std::size_t pos_{0};
};

struct LineError {
  errc code;
  std::string message;
};

// 解析 "N13" / "[X..17]" / "N6,yymmd0" 形式的组件
[[nodiscard]] std::optional<LineError> parse_component(std::string_view token,
                                                       Component& out) {
  const auto parts = split(token, ',');
  std::string_view desc = parts.front();

  if (!desc.empty() && desc.front() == '[') {
    if (desc.size() < 2 || desc.back() != ']') {
      return LineError{errc::invalid_component,
                       "Optional component is missing ']': " + std::string(token)};
    }
    out.optional = true;
    desc = desc.substr(1, desc.size() - 2);
  }

  if (desc.size() < 2) {
    return LineError{errc::invalid_component,
                     "Component specification is too short: " + std::string(token)};
  }

  const auto cset = lint::cset_from_letter(desc.front());
  if (!cset) {
    return LineError{errc::invalid_component,
                     "Unknown character set: " + std::string(1, desc.front())};
  }
  out.cset = *cset;
  desc.remove_prefix(1);

  bool variable = false;
  if (desc.substr(0, 2) == "..") {
    variable = true;
    desc.remove_prefix(2);
  }
  if (desc.empty() || desc.size() > 2 || !only_of(desc, kDigits) || desc.front() == '0') {
    return LineError{errc::invalid_component,
                     "Unrecognised component length: " + std::string(token)};
  }
  int len = 0;
  for (const char c : desc) {
    len = len * 10 + (c - '0');
  }
  out.max_length = static_cast<std::uint8_t>(len);
  out.min_length = variable ? 1 : out.max_length;

  for (std::size_t i = 1; i < parts.size(); ++i) {
    const auto linter = lint::linter_from_name(parts[i]);
    if (!linter) {
      return LineError{errc::unknown_linter, "Unknown linter: " + parts[i]};
    }
    out.linters.push_back(*linter);
  }
  return std::nullopt;
}

[[nodiscard]] std::optional<LineError> apply_attribute(std::string_view token,
                                                       AiEntry& entry) {
  const auto eq = token.find('=');
  const std::string_view name = token.substr(0, eq);
  if (name.empty() || !only_of(name, kAttrNameCharacters)) {
    return LineError{errc::invalid_attribute,
                     "Attribute name is invalid: " + std::string(token)};
  }

  if (eq == std::string_view::npos) {
    if (name == "dlpkey") {
      entry.dl_primary_key = true;
    }
    return std::nullopt;
  }

  const std::string_view value = token.substr(eq + 1);
  if (value.empty() || !only_of(value, kAttrValueCharacters)) {
    return LineError{errc::invalid_attribute,
                     "Attribute value is invalid: " + std::string(token)};
  }

  if (name == "req") {
    Requisite req;
    req.text = std::string(value);
    for (const auto& alt : split(value, ',')) {
      req.alternatives.push_back(split(alt, '+'));
    }
    entry.requisites.push_back(std::move(req));
  } else if (name == "ex") {
    for (auto& ai : split(value, ',')) {
      entry.exclusions.push_back(std::move(ai));
    }
  } else if (name == "dlpkey") {
    entry.dl_primary_key = true;
    for (const auto& group : split(value, '|')) {
      entry.dl_qualifier_groups.push_back(split(group, ','));
    }
  }
  // 其它属性不影响语义，忽略
  return std::nullopt;
}

/**
 * @brief 解析一行；区间会展开为多条条目追加到 out。
 */
[[nodiscard]] std::optional<LineError> parse_line(std::string_view line,
                                                  std::vector<AiEntry>& out) {
  LineTokenizer tok(line);
  auto token = tok.next();
  if (!token || token->front() == '#') {
    return std::nullopt;
  }

  AiEntry entry;
  char range_end = 0;
  std::string_view ai_token = *token;

  if (const auto dash = ai_token.find('-'); dash != std::string_view::npos) {
    const std::string_view first = ai_token.substr(0, dash);
    const std::string_view last = ai_token.substr(dash + 1);
    if (first.size() < core::kMinAILength || first.size() > core::kMaxAILength) {
      return LineError{errc::invalid_ai_range,
                       "AI range has the wrong width: " + std::string(ai_token)};
    }
    if (first.size() != last.size()) {
      return LineError{errc::invalid_ai_range,
                       "AIs in range must have equal width: " + std::string(ai_token)};
    }
    if (!only_of(first, kDigits) || !only_of(last, kDigits)) {
      return LineError{errc::invalid_ai_range,
                       "AIs must be numeric: " + std::string(ai_token)};
    }
    if (first.substr(0, first.size() - 1) != last.substr(0, last.size() - 1)) {
      return LineError{errc::invalid_ai_range,
                       "AI range parts may only differ in the last digit: " +
                           std::string(ai_token)};
    }
    if (first.back() >= last.back()) {
      return LineError{errc::invalid_ai_range,
                       "AI range end must exceed range start: " + std::string(ai_token)};
    }
    entry.ai = std::string(first);
    range_end = last.back();
  } else {
    if (ai_token.size() < core::kMinAILength || ai_token.size() > core::kMaxAILength ||
        !only_of(ai_token, kDigits)) {
      return LineError{errc::invalid_ai,
                       "AI must be 2 to 4 digits: " + std::string(ai_token)};
    }
    entry.ai = std::string(ai_token);
    range_end = ai_token.back();
  }

  token = tok.next();
  while (token && only_of(*token, kFlagCharacters)) {
    if (token->find('*') != std::string_view::npos) {
      entry.fnc1_required = false;
    }
    if (token->find('?') != std::string_view::npos) {
      entry.dl_data_attr = DLDataAttr::yes;
    }
    token = tok.next();
  }

  while (token && ((token->front() >= 'A' && token->front() <= 'Z') ||
                   token->front() == '[')) {
    Component component;
    if (auto err = parse_component(*token, component)) {
      return err;
    }
    entry.components.push_back(std::move(component));
    token = tok.next();
  }
  if (entry.components.empty()) {
    return LineError{errc::missing_components, "AI is missing components"};
  }
  for (std::size_t i = 0; i < entry.components.size(); ++i) {
    const auto& c = entry.components[i];
    if (i + 1 < entry.components.size() && c.min_length != c.max_length) {
      return LineError{errc::ambiguous_components,
                       "Only the final component may have variable length"};
    }
    if (i > 0 && !c.optional && entry.components[i - 1].optional) {
      return LineError{errc::ambiguous_components,
                       "A mandatory component cannot follow optional components"};
    }
  }

  while (token && *token != "#") {
    if (auto err = apply_attribute(*token, entry)) {
      return err;
    }
    token = tok.next();
  }

  if (token) {
    const std::string_view title = trim(tok.rest());
    for (const char c : title) {
      // 允许非 ASCII（UTF-8 的上标 ² ³ 等）
      if (static_cast<unsigned char>(c) < 0x80 &&
          kTitleCharacters.find(c) == std::string_view::npos) {
        return LineError{errc::invalid_title,
                         "Title contains illegal characters: " + std::string(title)};
      }
    }
    entry.title = std::string(title);
  }

  for (;;) {
    const char last = entry.ai.back();
    out.push_back(entry);
    if (last == range_end) {
      break;
    }
    ++entry.ai.back();
  }
  return std::nullopt;
}

}  // namespace

const std::error_category& error_category() noexcept { return kDictErrorCategory; }

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

LoadResult parse_syntax_dictionary(std::string_view text) {
  LoadResult result;
  std::vector<AiEntry> entries;
  std::set<std::string> seen;
  std::array<std::uint8_t, 100> prefix_lengths{};

  std::size_t line_number = 0;
  while (!text.empty()) {
    ++line_number;
    const auto nl = text.find('\n');
    std::string_view line = text.substr(0, nl);
    text.remove_prefix(nl == std::string_view::npos ? text.size() : nl + 1);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    const std::size_t first_new = entries.size();
    if (auto err = parse_line(line, entries)) {
      result.ec = make_error_code(err->code);
      result.error_line = line_number;
      result.error_message =
          "Syntax Dictionary line " + std::to_string(line_number) + ": " + err->message;
      return result;
    }

    for (std::size_t i = first_new; i < entries.size(); ++i) {
      const std::string& ai = entries[i].ai;
      if (!seen.insert(ai).second) {
        result.ec = make_error_code(errc::duplicate_ai);
        result.error_line = line_number;
        result.error_message = "Syntax Dictionary line " + std::to_string(line_number) +
                               ": AI (" + ai + ") is already defined";
        return result;
      }
      auto& len = prefix_lengths[static_cast<std::size_t>((ai[0] - '0') * 10 + (ai[1] - '0'))];
      if (len != 0 && len != ai.size()) {
        result.ec = make_error_code(errc::prefix_length_conflict);
        result.error_line = line_number;
        result.error_message = "AIs beginning '" + ai.substr(0, 2) +
                               "' have different lengths";
        return result;
      }
      len = static_cast<std::uint8_t>(ai.size());
    }
  }

  if (entries.empty()) {
    result.ec = make_error_code(errc::empty_dictionary);
    result.error_message = "The Syntax Dictionary defines no AIs";
    return result;
  }

  result.table = std::make_shared<const AiTable>(std::move(entries));
  return result;
}

LoadResult load_syntax_dictionary_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LoadResult result;
    result.ec = make_error_code(errc::cannot_read_file);
    result.error_message = "Cannot read file: " + path;
    return result;
  }
  std::ostringstream buf;
  buf << in.rdbuf();

  auto result = parse_syntax_dictionary(buf.str());
  if (result.ec) {
    spdlog::debug("gs1: syntax dictionary {} rejected: {}", path, result.error_message);
    return result;
  }
  spdlog::info("gs1: loaded syntax dictionary {} ({} AIs)", path, result.table->size());
  return result;
}

LoadResult load_embedded_syntax_dictionary() {
  return parse_syntax_dictionary(embedded_syntax_dictionary());
}

}  // namespace gs1::dict
