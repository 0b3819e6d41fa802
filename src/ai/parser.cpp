#include "gs1/ai/parser.hpp"

#include "gs1/core/common.hpp"
#include "gs1/core/error.hpp"
#include "gs1/lint/check_digit.hpp"
#include "gs1/lint/linters.hpp"

#include <algorithm>
#include <utility>

namespace gs1::ai {

namespace {

[[nodiscard]] std::string ai_message(std::string_view ai, std::string_view text) {
  std::string msg = "AI (";
  msg.append(ai);
  msg.append(") ");
  msg.append(text);
  return msg;
}

bool fail(ParseResult& out, std::error_code ec, std::string message) {
  out.ec = ec;
  out.error_message = std::move(message);
  return false;
}

void reset_on_failure(ParseResult& r) {
  r.elements.clear();
  r.data_str.clear();
}

}  // namespace

std::error_code check_value_length_content(const dict::AiEntry& entry, std::string_view ai,
                                           std::string_view value,
                                           std::string& error_message) {
  if (value.size() < entry.min_length()) {
    error_message = ai_message(ai, "value is too short");
    return make_error_code(errc::value_too_short);
  }
  if (value.size() > entry.max_length()) {
    error_message = ai_message(ai, "value is too long");
    return make_error_code(errc::value_too_long);
  }
  // '^' 与 FNC1 冲突，提前拒绝
  if (value.find(core::kFnc1) != std::string_view::npos) {
    error_message = ai_message(ai, "contains illegal ^ character");
    return make_error_code(errc::illegal_carat);
  }
  return {};
}

ValueCheck validate_ai_value(const dict::AiEntry& entry, std::string_view ai,
                             std::string_view value) {
  ValueCheck out;

  if (value.empty()) {
    out.ec = make_error_code(errc::value_empty);
    out.error_message = ai_message(ai, "data is empty");
    return out;
  }

  std::size_t pos = 0;
  for (const auto& component : entry.components) {
    const std::size_t complen =
        std::min<std::size_t>(value.size() - pos, component.max_length);

    if (component.optional && complen == 0) {
      continue;
    }
    if (complen < component.min_length) {
      out.ec = make_error_code(errc::incorrect_length);
      out.error_message = ai_message(ai, "data has incorrect length");
      return out;
    }

    const std::string_view compval = value.substr(pos, complen);
    lint::LintResult r = lint::lint_cset(component.cset, compval);
    for (std::size_t i = 0; r && i < component.linters.size(); ++i) {
      r = lint::lint(component.linters[i], compval);
    }

    if (!r) {
      const std::size_t errpos = std::min(r.error_pos, compval.size());
      const std::size_t errlen = std::min(r.error_length, compval.size() - errpos);

      out.ec = r.ec;
      out.error_message = "AI (" + std::string(ai) + "): " + r.ec.message();

      out.error_markup = "(" + std::string(ai) + ")";
      out.error_markup.append(value.substr(0, pos + errpos));
      out.error_markup.push_back(core::kMarkupDelimiter);
      out.error_markup.append(compval.substr(errpos, errlen));
      out.error_markup.push_back(core::kMarkupDelimiter);
      out.error_markup.append(compval.substr(errpos + errlen));
      return out;
    }

    pos += complen;
  }

  out.consumed = pos;
  return out;
}

std::optional<std::string> complete_check_digit(const dict::AiEntry& entry,
                                                std::string_view value) {
  if (entry.components.empty() || !entry.is_fixed_length() ||
      value.size() + 1 != entry.max_length()) {
    return std::nullopt;
  }

  const auto& last = entry.components.back();
  if (std::find(last.linters.begin(), last.linters.end(), lint::Linter::csum) ==
      last.linters.end()) {
    return std::nullopt;
  }

  const std::size_t payload_len = static_cast<std::size_t>(last.max_length) - 1;
  const auto check = lint::compute_check_digit(value.substr(value.size() - payload_len));
  if (!check) {
    return std::nullopt;
  }

  std::string completed(value);
  completed.push_back(*check);
  return completed;
}

Parser::Parser(const dict::AiTable& table, ParseOptions options) noexcept
    : table_(table), options_(options) {}

bool Parser::append_element(ParseResult& out, Element element) const {
  if (out.elements.size() >= core::kMaxAIs) {
    return fail(out, make_error_code(errc::too_many_ais), "Too many AIs");
  }
  out.elements.push_back(std::move(element));
  return true;
}

bool Parser::parse_element_string_into(std::string_view data, ParseResult& out) const {
  if (data.empty() || data.front() != core::kFnc1) {
    return fail(out, make_error_code(errc::missing_fnc1), "Missing FNC1 in first position");
  }
  if (data.size() == 1) {
    return fail(out, make_error_code(errc::empty_data), "The AI data is empty");
  }

  out.data_str.push_back(core::kFnc1);

  std::size_t p = 1;
  while (p < data.size()) {
    const std::string_view rest = data.substr(p);

    // 无分隔的数据中无法切分长度未知的未知 AI
    const auto match = table_.lookup_prefix(rest, options_.permit_unknown_ais);
    if (!match) {
      return fail(out, make_error_code(errc::no_ai_for_prefix),
                  "No known AI is a prefix of: " + std::string(rest.substr(0, 4)) + "...");
    }

    const std::string ai(rest.substr(0, match.ai_length));
    const dict::AiEntry& entry = *match.entry;
    p += match.ai_length;

    const std::size_t r = std::min(data.find(core::kFnc1, p), data.size());
    const std::string_view field = data.substr(p, r - p);

    std::optional<std::string> completed;
    if (options_.add_check_digit) {
      completed = complete_check_digit(entry, field);
    }
    const std::string_view candidate = completed ? std::string_view(*completed) : field;

    if (candidate.size() < entry.min_length()) {
      return fail(out, make_error_code(errc::value_too_short), ai_message(ai, "value is too short"));
    }

    auto check = validate_ai_value(entry, ai, candidate);
    if (check.ec) {
      out.error_markup = std::move(check.error_markup);
      return fail(out, check.ec, std::move(check.error_message));
    }

    std::string value(candidate.substr(0, check.consumed));
    p += completed ? field.size() : check.consumed;

    out.data_str.append(ai);
    out.data_str.append(value);
    if (!append_element(out, make_ai_element(entry, ai, std::move(value)))) {
      return false;
    }

    // FNC1 结尾的 AI 之后只能是 FNC1 或数据末尾
    if (entry.fnc1_required && p < data.size() && data[p] != core::kFnc1) {
      return fail(out, make_error_code(errc::missing_separator),
                  ai_message(ai, "data is too long"));
    }

    // 定长 AI 之后的 FNC1 也予以容忍
    if (p < data.size() && data[p] == core::kFnc1) {
      out.data_str.push_back(core::kFnc1);
      ++p;
    }
  }

  return true;
}

bool Parser::parse_bracketed_into(std::string_view ai_data, ParseResult& out) const {
  bool fnc1_required = true;
  std::size_t p = 0;

  if (ai_data.empty()) {
    return fail(out, make_error_code(errc::malformed_ai_data), "Failed to parse AI data");
  }

  while (p < ai_data.size()) {
    if (ai_data[p] != '(') {
      return fail(out, make_error_code(errc::malformed_ai_data), "Failed to parse AI data");
    }
    const std::size_t close = ai_data.find(')', p + 1);
    if (close == std::string_view::npos) {
      return fail(out, make_error_code(errc::malformed_ai_data), "Failed to parse AI data");
    }

    const std::string ai(ai_data.substr(p + 1, close - p - 1));
    const dict::AiEntry* entry = table_.lookup(ai, options_.permit_unknown_ais);
    if (entry == nullptr) {
      return fail(out, make_error_code(errc::unrecognised_ai), "Unrecognised AI: " + ai);
    }

    std::size_t r = close + 1;
    if (r == ai_data.size()) {
      return fail(out, make_error_code(errc::malformed_ai_data), "Failed to parse AI data");
    }

    // 值到下一个未转义的 '(' 为止；"\(" 为数据中的 '('
    std::string value;
    for (;;) {
      const std::size_t q = ai_data.find('(', r);
      if (q != std::string_view::npos && q > r && ai_data[q - 1] == '\\') {
        value.append(ai_data.substr(r, q - 1 - r));
        value.push_back('(');
        r = q + 1;
        continue;
      }
      const std::size_t end = q == std::string_view::npos ? ai_data.size() : q;
      value.append(ai_data.substr(r, end - r));
      p = end;
      break;
    }

    if (options_.add_check_digit) {
      if (auto completed = complete_check_digit(*entry, value)) {
        value = std::move(*completed);
      }
    }

    std::string message;
    if (auto ec = check_value_length_content(*entry, ai, value, message)) {
      return fail(out, ec, std::move(message));
    }

    auto check = validate_ai_value(*entry, ai, value);
    if (check.ec) {
      out.error_markup = std::move(check.error_markup);
      return fail(out, check.ec, std::move(check.error_message));
    }

    if (fnc1_required) {
      out.data_str.push_back(core::kFnc1);
    }
    out.data_str.append(ai);
    out.data_str.append(value);
    fnc1_required = entry->fnc1_required;

    if (!append_element(out, make_ai_element(*entry, ai, std::move(value)))) {
      return false;
    }
  }

  return true;
}

ParseResult Parser::parse_element_string(std::string_view data) const {
  ParseResult result;
  if (!parse_element_string_into(data, result)) {
    reset_on_failure(result);
  }
  return result;
}

ParseResult Parser::parse_data_str(std::string_view data) const {
  ParseResult result;

  if (data.size() > core::kMaxDataLength) {
    fail(result, core::make_error_code(core::errc::data_too_long),
         "Maximum data length is " + std::to_string(core::kMaxDataLength) + " characters");
    return result;
  }

  const std::size_t bar = data.find(core::kCompositeSeparator);
  bool ok = true;

  if (bar != std::string_view::npos) {
    const std::string_view linear = data.substr(0, bar);
    const std::string_view cc = data.substr(bar + 1);

    // 线性部分可以是非 AI 数据（如 EAN/UPC 的主数据）
    if (!linear.empty() && linear.front() == core::kFnc1) {
      ok = parse_element_string_into(linear, result);
    } else {
      result.data_str.append(linear);
    }
    if (ok) {
      result.data_str.push_back(core::kCompositeSeparator);
      ok = append_element(result, make_composite_separator()) &&
           parse_element_string_into(cc, result);
    }
  } else if (!data.empty() && data.front() == core::kFnc1) {
    ok = parse_element_string_into(data, result);
  } else {
    result.data_str.assign(data);
  }

  if (!ok) {
    reset_on_failure(result);
  }
  return result;
}

ParseResult Parser::parse_ai_data_str(std::string_view ai_data) const {
  ParseResult result;

  if (ai_data.size() > core::kMaxDataLength) {
    fail(result, core::make_error_code(core::errc::data_too_long),
         "Maximum data length is " + std::to_string(core::kMaxDataLength) + " characters");
    return result;
  }

  bool ok = true;
  const std::size_t bar = ai_data.find(core::kCompositeSeparator);
  if (bar != std::string_view::npos) {
    ok = parse_bracketed_into(ai_data.substr(0, bar), result);
    if (ok) {
      result.data_str.push_back(core::kCompositeSeparator);
      ok = append_element(result, make_composite_separator()) &&
           parse_bracketed_into(ai_data.substr(bar + 1), result);
    }
  } else {
    ok = parse_bracketed_into(ai_data, result);
  }

  if (!ok) {
    reset_on_failure(result);
  }
  return result;
}

}  // namespace gs1::ai
