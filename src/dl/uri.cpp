#include "gs1/dl/uri.hpp"

#include "gs1/ai/parser.hpp"
#include "gs1/core/common.hpp"
#include "gs1/core/error.hpp"
#include "gs1/lint/check_digit.hpp"

#include <array>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gs1::dl {

namespace {

class DlErrorCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "gs1.dl"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::illegal_characters:
        return "URI contains illegal characters";
      case errc::illegal_scheme:
        return "URI contains illegal scheme";
      case errc::illegal_domain:
        return "domain contains illegal characters";
      case errc::missing_domain_or_path:
        return "URI must contain a domain and path info";
      case errc::no_key_in_path:
        return "no GS1 DL keys found in path info";
      case errc::empty_path_value:
        return "AI value path element is empty";
      case errc::illegal_null:
        return "decoded AI value contains illegal null character";
      case errc::unknown_query_ai:
        return "unknown AI in query parameters";
      case errc::empty_query_value:
        return "AI value query element is empty";
      case errc::invalid_key_qualifier_sequence:
        return "path AIs are not a valid key-qualifier sequence";
      case errc::duplicate_ai:
        return "AI is duplicated";
      case errc::not_data_attribute:
        return "AI is not a valid DL URI data attribute";
      case errc::belongs_in_path:
        return "AI from query params should be in the path info";
      case errc::no_primary_key:
        return "cannot create a DL URI without a primary key AI";
      default:
        return "unknown gs1.dl error";
    }
  }
};

constexpr std::string_view kUriCharacters =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
    "-._~:/?#[]@!$&'()*+,;=%";
constexpr std::string_view kBadDomainCharacters = "_~?#@!$&'()*+,;=%";
constexpr std::string_view kHex = "0123456789ABCDEF";

constexpr std::string_view kGtinAI = "01";

struct ConvenienceAlpha {
  std::string_view alpha;
  std::string_view ai;
};

// 历史上的 DL 路径别名
constexpr std::array<ConvenienceAlpha, 22> kConvenienceAlphas{{
    {"cpid", "8010"}, {"cpsn", "8011"}, {"cpv", "22"},    {"gcn", "255"},
    {"gdti", "253"},  {"giai", "8004"}, {"ginc", "401"},  {"gln", "414"},
    {"glnx", "254"},  {"gmn", "8013"},  {"grai", "8003"}, {"gsin", "402"},
    {"gsrn", "8018"}, {"gsrnp", "8017"}, {"gtin", "01"},  {"itip", "8006"},
    {"lot", "10"},    {"party", "417"}, {"refno", "8020"}, {"ser", "21"},
    {"srin", "8019"}, {"sscc", "00"},
}};

[[nodiscard]] bool is_unreserved(char c) noexcept {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || core::is_digit(c) ||
         c == '-' || c == '.' || c == '_' || c == '~';
}

[[nodiscard]] int hex_nibble(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  for (;;) {
    const auto pos = s.find(sep);
    out.push_back(s.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    s.remove_prefix(pos + 1);
  }
  return out;
}

[[nodiscard]] std::string ai_message(std::string_view ai, std::string_view text) {
  return "AI (" + std::string(ai) + ") " + std::string(text);
}

bool fail(ParseResult& out, errc e, std::string message) {
  out.ec = make_error_code(e);
  out.error_message = std::move(message);
  return false;
}

// 8/12/13 位的 GTIN 左补零到 14 位
void pad_gtin(const dict::AiEntry& entry, std::string& value) {
  if (entry.ai != kGtinAI || (value.size() != 8 && value.size() != 12 && value.size() != 13)) {
    return;
  }
  if (auto expanded = lint::expand_zero_suppressed_gtin(value)) {
    value = std::move(*expanded);
  }
}

[[nodiscard]] bool is_data_attribute(const dict::AiEntry& entry,
                                     bool unknown_ai_not_dl_attr) noexcept {
  switch (entry.dl_data_attr) {
    case dict::DLDataAttr::yes:
      return true;
    case dict::DLDataAttr::unknown_ai:
      return !unknown_ai_not_dl_attr;
    case dict::DLDataAttr::no:
      break;
  }
  return false;
}

class UriParser {
 public:
  UriParser(const dict::AiTable& table, const ParseOptions& options) noexcept
      : table_(table), options_(options) {}

  bool parse(std::string_view uri, ParseResult& out);

 private:
  // 路径段 -> AI 条目（可能经由便捷别名）
  [[nodiscard]] const dict::AiEntry* resolve_path_ai(std::string_view segment,
                                                     bool& from_alpha) const noexcept;
  bool add_element(ParseResult& out, ai::Element element) const;
  bool parse_query(std::string_view query, ParseResult& out) const;
  bool check_attributes(ParseResult& out, const std::vector<std::string>& path_ais) const;

  const dict::AiTable& table_;
  const ParseOptions& options_;
};

const dict::AiEntry* UriParser::resolve_path_ai(std::string_view segment,
                                                bool& from_alpha) const noexcept {
  from_alpha = false;
  if (options_.permit_convenience_alphas && segment.size() >= 3 && segment.size() <= 5 &&
      !core::is_digit(segment.front())) {
    for (const auto& alpha : kConvenienceAlphas) {
      if (alpha.alpha == segment) {
        if (const auto* entry = table_.find(alpha.ai)) {
          from_alpha = true;
          return entry;
        }
        break;
      }
    }
  }
  return table_.lookup(segment, options_.permit_unknown_ais);
}

bool UriParser::add_element(ParseResult& out, ai::Element element) const {
  if (out.elements.size() >= core::kMaxAIs) {
    out.ec = ai::make_error_code(ai::errc::too_many_ais);
    out.error_message = "Too many AIs";
    return false;
  }
  out.elements.push_back(std::move(element));
  return true;
}

bool UriParser::parse(std::string_view uri, ParseResult& out) {
  if (uri.find_first_not_of(kUriCharacters) != std::string_view::npos) {
    return fail(out, errc::illegal_characters, "URI contains illegal characters");
  }

  std::size_t p = 0;
  if (uri.substr(0, 8) == "https://" || uri.substr(0, 8) == "HTTPS://") {
    p = 8;
  } else if (uri.substr(0, 7) == "http://" || uri.substr(0, 7) == "HTTP://") {
    p = 7;
  } else {
    return fail(out, errc::illegal_scheme, "URI contains illegal scheme");
  }

  const std::size_t slash = uri.find('/', p);
  const std::string_view domain =
      uri.substr(p, (slash == std::string_view::npos ? uri.size() : slash) - p);
  if (domain.find_first_of(kBadDomainCharacters) != std::string_view::npos) {
    return fail(out, errc::illegal_domain, "Domain contains illegal characters");
  }
  if (slash == std::string_view::npos || domain.empty()) {
    return fail(out, errc::missing_domain_or_path, "URI must contain a domain and path info");
  }

  // 片段标记之后的内容不属于数据
  std::string_view rest = uri.substr(slash);
  rest = rest.substr(0, rest.find('#'));

  std::string_view path = rest;
  std::string_view query;
  if (const auto q = rest.find('?'); q != std::string_view::npos) {
    path = rest.substr(0, q);
    query = rest.substr(q + 1);
  }

  // path 以 '/' 开头
  const auto segments = split(path.substr(1), '/');

  // 从后往前按 "/AI/value" 成对回溯，直到遇到主键
  std::optional<std::size_t> key_index;
  for (std::size_t i = segments.size(); i >= 2; i -= 2) {
    bool from_alpha = false;
    const auto* entry = resolve_path_ai(segments[i - 2], from_alpha);
    if (entry == nullptr) {
      break;
    }
    if (table_.is_dl_primary_key(entry->ai)) {
      key_index = i - 2;
      break;
    }
  }
  if (!key_index) {
    return fail(out, errc::no_key_in_path, "No GS1 DL keys found in path info");
  }

  out.stem = std::string(uri.substr(0, slash));
  for (std::size_t i = 0; i < *key_index; ++i) {
    out.stem.push_back('/');
    out.stem.append(segments[i]);
  }

  std::vector<std::string> path_ais;
  for (std::size_t i = *key_index; i + 1 < segments.size(); i += 2) {
    bool from_alpha = false;
    const auto* entry = resolve_path_ai(segments[i], from_alpha);
    const std::string ai = from_alpha ? entry->ai : std::string(segments[i]);

    if (segments[i + 1].empty()) {
      return fail(out, errc::empty_path_value, ai_message(ai, "value path element is empty"));
    }

    auto value = uri_unescape(segments[i + 1], false);
    if (!value) {
      return fail(out, errc::illegal_null,
                  "Decoded AI (" + ai + ") from DL path info contains illegal null character");
    }
    if (options_.permit_zero_suppressed_gtin) {
      pad_gtin(*entry, *value);
    }

    std::string message;
    if (auto ec = ai::check_value_length_content(*entry, ai, *value, message)) {
      out.ec = ec;
      out.error_message = std::move(message);
      return false;
    }

    auto element = ai::make_ai_element(*entry, ai, std::move(*value));
    element.dl_path_order = static_cast<int>(path_ais.size());
    path_ais.push_back(ai);
    if (!add_element(out, std::move(element))) {
      return false;
    }
  }

  if (!parse_query(query, out)) {
    return false;
  }

  if (!table_.is_valid_dl_path_sequence(path_ais)) {
    return fail(out, errc::invalid_key_qualifier_sequence,
                "The AIs in the path are not a valid key-qualifier sequence for the key");
  }

  if (!check_attributes(out, path_ais)) {
    return false;
  }

  // 最后才做组件级校验，先报告结构性问题
  for (const auto& e : out.elements) {
    if (e.kind != ai::ElementKind::ai_value) {
      continue;
    }
    auto check = ai::validate_ai_value(*e.entry, e.ai, e.value);
    if (check.ec) {
      out.ec = check.ec;
      out.error_message = std::move(check.error_message);
      out.error_markup = std::move(check.error_markup);
      return false;
    }
  }
  return true;
}

bool UriParser::parse_query(std::string_view query, ParseResult& out) const {
  if (query.empty()) {
    return true;
  }

  for (const auto param : split(query, '&')) {
    if (param.empty()) {
      continue;
    }

    const auto eq = param.find('=');
    const std::string_view key = param.substr(0, eq);
    const bool numeric = eq != std::string_view::npos && !key.empty() && core::all_digits(key);

    // 无值参数与非数字键原样保留，不做解码
    if (!numeric) {
      ai::Element ignored;
      ignored.kind = ai::ElementKind::dl_ignored_param;
      ignored.value = std::string(param);
      if (!add_element(out, std::move(ignored))) {
        return false;
      }
      continue;
    }

    const std::string ai(key);
    const auto* entry = table_.lookup(ai, options_.permit_unknown_ais);
    if (entry == nullptr) {
      return fail(out, errc::unknown_query_ai, "Unknown AI (" + ai + ") in query parameters");
    }

    const std::string_view raw = param.substr(eq + 1);
    if (raw.empty()) {
      return fail(out, errc::empty_query_value, ai_message(ai, "value query element is empty"));
    }

    auto value = uri_unescape(raw, true);
    if (!value) {
      return fail(out, errc::illegal_null,
                  "Decoded AI (" + ai + ") value from query params contains illegal null character");
    }
    pad_gtin(*entry, *value);

    std::string message;
    if (auto ec = ai::check_value_length_content(*entry, ai, *value, message)) {
      out.ec = ec;
      out.error_message = std::move(message);
      return false;
    }

    if (!add_element(out, ai::make_ai_element(*entry, ai, std::move(*value)))) {
      return false;
    }
  }
  return true;
}

bool UriParser::check_attributes(ParseResult& out,
                                 const std::vector<std::string>& path_ais) const {
  const auto& elements = out.elements;

  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (elements[i].kind != ai::ElementKind::ai_value) {
      continue;
    }
    for (std::size_t j = i + 1; j < elements.size(); ++j) {
      if (elements[j].kind == ai::ElementKind::ai_value && elements[j].ai == elements[i].ai) {
        return fail(out, errc::duplicate_ai, ai_message(elements[i].ai, "is duplicated"));
      }
    }
  }

  for (const auto& e : elements) {
    if (e.kind != ai::ElementKind::ai_value || e.dl_path_order != ai::kDLPathOrderAttribute) {
      continue;
    }

    if (!is_data_attribute(*e.entry, options_.unknown_ai_not_dl_attr)) {
      return fail(out, errc::not_data_attribute,
                  ai_message(e.ai, "is not a valid DL URI data attribute"));
    }

    // 插入到路径的任一非首位置能构成合法组合，则应当出现在路径中
    for (std::size_t pos = 1; pos <= path_ais.size(); ++pos) {
      auto trial = path_ais;
      trial.insert(trial.begin() + static_cast<std::ptrdiff_t>(pos), e.ai);
      if (table_.is_valid_dl_path_sequence(trial)) {
        return fail(out, errc::belongs_in_path,
                    "AI (" + e.ai + ") from query params should be in the path info");
      }
    }
  }
  return true;
}

// 未带路径顺序的元素：序列中第一个主键 AI 作主键，并选出数据能满足的最长限定符组合
[[nodiscard]] std::vector<std::size_t> assign_path(const dict::AiTable& table,
                                                   const ai::ElementSequence& elements) {
  const auto index_of = [&elements](std::string_view ai) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < elements.size(); ++i) {
      if (elements[i].kind == ai::ElementKind::ai_value && elements[i].ai == ai) {
        return i;
      }
    }
    return std::nullopt;
  };

  std::optional<std::size_t> key;
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (elements[i].kind == ai::ElementKind::ai_value && table.is_dl_primary_key(elements[i].ai)) {
      key = i;
      break;
    }
  }
  if (!key) {
    return {};
  }

  // 按限定符个数从多到少，第一个全部满足的即最长组合
  for (const auto& seq : table.qualifier_sequences(elements[*key].ai)) {
    std::vector<std::size_t> path{*key};
    bool satisfied = true;
    for (std::size_t i = 1; i < seq.size(); ++i) {
      const auto idx = index_of(seq[i]);
      if (!idx) {
        satisfied = false;
        break;
      }
      path.push_back(*idx);
    }
    if (satisfied) {
      return path;
    }
  }
  return {*key};
}

}  // namespace

const std::error_category& error_category() noexcept {
  static DlErrorCategory category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

bool is_dl_uri(std::string_view data) noexcept {
  return data.substr(0, 8) == "https://" || data.substr(0, 8) == "HTTPS://" ||
         data.substr(0, 7) == "http://" || data.substr(0, 7) == "HTTP://";
}

std::string uri_escape(std::string_view in, bool query_component) {
  std::string out;
  out.reserve(in.size());
  for (const char ch : in) {
    const auto c = static_cast<unsigned char>(ch);
    if (is_unreserved(ch)) {
      out.push_back(ch);
    } else if (ch == ' ' && query_component) {
      out.push_back('+');
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::optional<std::string> uri_unescape(std::string_view in, bool query_component) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size()) {
      const int hi = hex_nibble(in[i + 1]);
      const int lo = hex_nibble(in[i + 2]);
      if (hi < 0 || lo < 0) {
        out.push_back('%');
        continue;
      }
      const char decoded = static_cast<char>((hi << 4) | lo);
      if (decoded == '\0') {
        return std::nullopt;
      }
      out.push_back(decoded);
      i += 2;
    } else if (query_component && in[i] == '+') {
      out.push_back(' ');
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

ParseResult parse_uri(const dict::AiTable& table, std::string_view uri,
                      const ParseOptions& options) {
  ParseResult result;
  if (uri.size() > core::kMaxDataLength) {
    result.ec = core::make_error_code(core::errc::data_too_long);
    result.error_message =
        "Maximum data length is " + std::to_string(core::kMaxDataLength) + " characters";
    return result;
  }

  UriParser parser(table, options);
  if (!parser.parse(uri, result)) {
    result.elements.clear();
    result.stem.clear();
  }
  return result;
}

BuildResult build_uri(const dict::AiTable& table, const ai::ElementSequence& elements,
                      std::optional<std::string_view> stem, bool unknown_ai_not_dl_attr) {
  BuildResult result;

  // 已带路径顺序（数据来自 DL URI）时沿用
  std::vector<std::size_t> path;
  for (std::size_t i = 0; i < elements.size(); ++i) {
    const auto& e = elements[i];
    if (e.kind != ai::ElementKind::ai_value || e.dl_path_order == ai::kDLPathOrderAttribute) {
      continue;
    }
    const auto order = static_cast<std::size_t>(e.dl_path_order);
    if (path.size() <= order) {
      path.resize(order + 1, elements.size());
    }
    path[order] = i;
  }

  if (path.empty()) {
    path = assign_path(table, elements);
  }
  if (path.empty()) {
    result.ec = make_error_code(errc::no_primary_key);
    result.error_message = "Cannot create a DL URI without a primary key AI";
    return result;
  }

  std::string uri(stem ? *stem : core::kCanonicalDLStem);
  if (!uri.empty() && uri.back() == '/') {
    uri.pop_back();
  }

  std::vector<bool> emitted(elements.size(), false);
  std::set<std::string> emitted_ais;
  for (const auto idx : path) {
    if (idx >= elements.size()) {
      continue;
    }
    const auto& e = elements[idx];
    uri += "/" + e.ai + "/" + uri_escape(e.value, false);
    emitted[idx] = true;
    emitted_ais.insert(e.ai);
  }

  // 定长（无需 FNC1）的属性排在前面，重复的 AI 只输出一次
  char sep = '?';
  for (const bool fixed_length : {true, false}) {
    for (std::size_t i = 0; i < elements.size(); ++i) {
      const auto& e = elements[i];
      if (e.kind != ai::ElementKind::ai_value || emitted[i] ||
          e.dl_path_order != ai::kDLPathOrderAttribute) {
        continue;
      }
      if (e.entry->fnc1_required == fixed_length || emitted_ais.count(e.ai) != 0) {
        continue;
      }
      if (!is_data_attribute(*e.entry, unknown_ai_not_dl_attr)) {
        result.ec = make_error_code(errc::not_data_attribute);
        result.error_message = ai_message(e.ai, "is not a valid DL URI data attribute");
        return result;
      }
      uri.push_back(sep);
      uri += e.ai + "=" + uri_escape(e.value, true);
      sep = '&';
      emitted_ais.insert(e.ai);
    }
  }

  result.uri = std::move(uri);
  return result;
}

}  // namespace gs1::dl
