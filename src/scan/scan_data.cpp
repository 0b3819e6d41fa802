#include "gs1/scan/scan_data.hpp"

#include "gs1/core/common.hpp"
#include "gs1/core/error.hpp"
#include "gs1/lint/check_digit.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace gs1::scan {

namespace {

class ScanErrorCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "gs1.scan"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::no_symbology:
        return "no symbology selected";
      case errc::incompatible_data:
        return "data is not compatible with the symbology";
      case errc::primary_data_wrong_length:
        return "primary data has the wrong number of digits";
      case errc::primary_data_not_digits:
        return "primary data must be all digits";
      case errc::primary_data_check_digit_incorrect:
        return "primary data check digit is incorrect";
      case errc::primary_data_too_large:
        return "primary data item value is too large";
      case errc::missing_symbology_identifier:
        return "missing symbology identifier";
      case errc::unsupported_symbology_identifier:
        return "unsupported symbology identifier";
      case errc::primary_scan_data_too_short:
        return "primary scan data is too short";
      case errc::primary_message_too_long:
        return "primary message is too long";
      case errc::primary_message_not_digits:
        return "primary message may only contain digits";
      case errc::primary_message_check_digit_incorrect:
        return "primary message check digit is incorrect";
      case errc::illegal_carat:
        return "scan data contains illegal ^ character";
      default:
        return "unknown gs1.scan error";
    }
  }
};

enum class Mode : std::uint8_t { ai, non_ai };

struct SymIdEntry {
  std::string_view sym_id;
  Mode mode;
  Symbology sym;
};

// 按标识符反查时取第一个匹配项
constexpr std::array<SymIdEntry, 27> kSymIdTable{{
    {"C1", Mode::ai, Symbology::gs1_128_cca},
    {"C1", Mode::ai, Symbology::gs1_128_ccc},
    {"E0", Mode::non_ai, Symbology::ean13},
    {"E0", Mode::ai, Symbology::ean13},
    {"E0", Mode::non_ai, Symbology::upca},
    {"E0", Mode::ai, Symbology::upca},
    {"E0", Mode::non_ai, Symbology::upce},
    {"E0", Mode::ai, Symbology::upce},
    {"E4", Mode::non_ai, Symbology::ean8},
    {"E4", Mode::ai, Symbology::ean8},
    {"e0", Mode::ai, Symbology::databar_expanded},
    {"e0", Mode::ai, Symbology::databar_omni},
    {"e0", Mode::non_ai, Symbology::databar_omni},
    {"e0", Mode::ai, Symbology::databar_truncated},
    {"e0", Mode::non_ai, Symbology::databar_truncated},
    {"e0", Mode::ai, Symbology::databar_stacked},
    {"e0", Mode::non_ai, Symbology::databar_stacked},
    {"e0", Mode::ai, Symbology::databar_stacked_omni},
    {"e0", Mode::non_ai, Symbology::databar_stacked_omni},
    {"e0", Mode::ai, Symbology::databar_limited},
    {"e0", Mode::non_ai, Symbology::databar_limited},
    {"d1", Mode::non_ai, Symbology::dm},
    {"d2", Mode::ai, Symbology::dm},
    {"Q1", Mode::non_ai, Symbology::qr},
    {"Q3", Mode::ai, Symbology::qr},
    {"J0", Mode::non_ai, Symbology::dotcode},
    {"J1", Mode::ai, Symbology::dotcode},
}};

// GS1-128 复合码与 DataBar 复合码共用
constexpr std::string_view kCompositeSymId = "]e0";

[[nodiscard]] std::string_view sym_id_for(Symbology sym, Mode mode) noexcept {
  for (const auto& entry : kSymIdTable) {
    if (entry.sym == sym && entry.mode == mode) {
      return entry.sym_id;
    }
  }
  return {};
}

[[nodiscard]] const SymIdEntry* entry_for_sym_id(std::string_view sym_id) noexcept {
  for (const auto& entry : kSymIdTable) {
    if (entry.sym_id == sym_id) {
      return &entry;
    }
  }
  return nullptr;
}

[[nodiscard]] bool is_ai_data(std::string_view data) noexcept {
  return !data.empty() && data.front() == core::kFnc1;
}

// AI 数据：去掉首个 FNC1，其余 '^' 转为 GS；非 AI 数据：去掉 "\…^" 转义的第一个 '\'
void append_scan_payload(std::string& out, std::string_view data) {
  if (is_ai_data(data)) {
    for (const char c : data.substr(1)) {
      out.push_back(c == core::kFnc1 ? core::kGroupSeparator : c);
    }
    return;
  }

  const std::size_t first = data.find_first_not_of('\\');
  if (first != std::string_view::npos && first > 0 && data[first] == core::kFnc1) {
    data.remove_prefix(1);
  }
  out.append(data);
}

bool fail(EncodeResult& out, errc e, std::string message) {
  out.scan_data.clear();
  out.ec = make_error_code(e);
  out.error_message = std::move(message);
  return false;
}

bool fail(DecodeResult& out, errc e, std::string message) {
  out.symbology = Symbology::none;
  out.data_str.clear();
  out.ec = make_error_code(e);
  out.error_message = std::move(message);
  return false;
}

// 主数据必须是 length 位数字（补校验位时允许少一位），校验位被计算或核对
bool append_primary(EncodeResult& out, std::string_view primary, std::size_t length,
                    bool add_check_digit) {
  const bool short_by_one = add_check_digit && primary.size() + 1 == length;
  if (primary.size() != length && !short_by_one) {
    if (add_check_digit) {
      return fail(out, errc::primary_data_wrong_length,
                  "Primary data must be " + std::to_string(length - 1) +
                      " digits without check digit");
    }
    return fail(out, errc::primary_data_wrong_length,
                "Primary data must be " + std::to_string(length) + " digits");
  }
  if (!core::all_digits(primary)) {
    return fail(out, errc::primary_data_not_digits, "Primary data must be all digits");
  }

  if (short_by_one) {
    const auto check = lint::compute_check_digit(primary);
    if (!check) {
      return fail(out, errc::primary_data_not_digits, "Primary data must be all digits");
    }
    out.scan_data.append(primary);
    out.scan_data.push_back(*check);
    return true;
  }

  if (!lint::verify_check_digit(primary)) {
    return fail(out, errc::primary_data_check_digit_incorrect,
                "Primary data check digit is incorrect");
  }
  out.scan_data.append(primary);
  return true;
}

[[nodiscard]] bool last_linear_ai_needs_fnc1(const ai::ElementSequence& elements) noexcept {
  bool needs = false;
  for (const auto& e : elements) {
    if (e.kind == ai::ElementKind::composite_separator) {
      break;
    }
    if (e.kind == ai::ElementKind::ai_value && e.entry != nullptr) {
      needs = e.entry->fnc1_required;
    }
  }
  return needs;
}

bool encode(EncodeResult& out, Symbology sym, std::string_view data_str,
            const ai::ElementSequence& elements, bool add_check_digit) {
  std::string_view linear = data_str;
  std::optional<std::string_view> cc;
  if (const auto bar = data_str.find(core::kCompositeSeparator);
      bar != std::string_view::npos) {
    linear = data_str.substr(0, bar);
    cc = data_str.substr(bar + 1);
  }

  const Mode mode = is_ai_data(data_str) ? Mode::ai : Mode::non_ai;

  switch (sym) {
    case Symbology::qr:
    case Symbology::dm:
    case Symbology::dotcode:
      // 2D 码没有复合部分；非 AI 数据中的 '|' 只是普通字符
      if (mode == Mode::ai && cc) {
        return fail(out, errc::incompatible_data,
                    "Composite component is not supported by " +
                        std::string(symbology_name(sym)));
      }
      out.scan_data.push_back(']');
      out.scan_data.append(sym_id_for(sym, mode));
      append_scan_payload(out.scan_data, data_str);
      return true;

    case Symbology::gs1_128_cca:
    case Symbology::gs1_128_ccc:
      if (!cc) {
        if (mode != Mode::ai) {
          return fail(out, errc::incompatible_data, "GS1-128 requires AI data");
        }
        out.scan_data.push_back(']');
        out.scan_data.append(sym_id_for(sym, mode));
        append_scan_payload(out.scan_data, data_str);
        return true;
      }
      [[fallthrough]];

    case Symbology::databar_expanded:
      if (!is_ai_data(linear)) {
        return fail(out, errc::incompatible_data,
                    std::string(symbology_name(sym)) + " requires AI data");
      }
      out.scan_data.append(kCompositeSymId);
      append_scan_payload(out.scan_data, linear);
      if (cc) {
        if (!is_ai_data(*cc)) {
          return fail(out, errc::incompatible_data, "Composite component requires AI data");
        }
        if (last_linear_ai_needs_fnc1(elements)) {
          out.scan_data.push_back(core::kGroupSeparator);
        }
        append_scan_payload(out.scan_data, *cc);
      }
      return true;

    case Symbology::databar_omni:
    case Symbology::databar_truncated:
    case Symbology::databar_stacked:
    case Symbology::databar_stacked_omni:
    case Symbology::databar_limited: {
      std::string_view primary = linear;
      if (primary.substr(0, 3) == "^01") {
        primary.remove_prefix(3);
      }

      out.scan_data.push_back(']');
      out.scan_data.append(sym_id_for(sym, mode));
      out.scan_data.append("01");
      const std::size_t primary_pos = out.scan_data.size();
      if (!append_primary(out, primary, 14, add_check_digit)) {
        return false;
      }

      // DataBar Limited 只能承载小于 2*10^13 的值
      if (sym == Symbology::databar_limited && out.scan_data[primary_pos] >= '2') {
        return fail(out, errc::primary_data_too_large, "Primary data item value is too large");
      }

      if (cc) {
        if (!is_ai_data(*cc)) {
          return fail(out, errc::incompatible_data, "Composite component requires AI data");
        }
        append_scan_payload(out.scan_data, *cc);
      }
      return true;
    }

    case Symbology::upca:
    case Symbology::upce:
    case Symbology::ean13:
    case Symbology::ean8: {
      // EAN-13 13 位、EAN-8 8 位；UPC 规范化为 12 位，并补一个前导 '0'
      std::size_t length = 12;
      if (sym == Symbology::ean13) {
        length = 13;
      } else if (sym == Symbology::ean8) {
        length = 8;
      }

      // 以 (01) 开头的 AI 数据去掉 GTIN-14 多出的前导零
      std::string_view primary = linear;
      const std::size_t ai_zeros = 17 - length;
      if (primary.substr(0, ai_zeros) == std::string_view("^01000000").substr(0, ai_zeros)) {
        primary.remove_prefix(ai_zeros);
      }

      out.scan_data.push_back(']');
      out.scan_data.append(sym_id_for(sym, mode));
      if (length == 12) {
        out.scan_data.push_back('0');
      }
      if (!append_primary(out, primary, length, add_check_digit)) {
        return false;
      }

      // 复合部分作为以 "]e0" 开头的新消息
      if (cc) {
        if (!is_ai_data(*cc)) {
          return fail(out, errc::incompatible_data, "Composite component requires AI data");
        }
        out.scan_data.push_back(core::kCompositeSeparator);
        out.scan_data.append(kCompositeSymId);
        append_scan_payload(out.scan_data, *cc);
      }
      return true;
    }

    case Symbology::none:
      break;
  }

  return fail(out, errc::no_symbology, "No symbology selected");
}

bool decode(DecodeResult& out, std::string_view scan_data) {
  if (scan_data.size() < 3 || scan_data.front() != ']') {
    return fail(out, errc::missing_symbology_identifier, "Missing symbology identifier");
  }

  const SymIdEntry* entry = entry_for_sym_id(scan_data.substr(1, 2));
  if (entry == nullptr) {
    return fail(out, errc::unsupported_symbology_identifier,
                "Unsupported symbology identifier");
  }

  std::string_view data = scan_data.substr(3);
  if (data.size() > core::kMaxDataLength) {
    out.symbology = Symbology::none;
    out.ec = core::make_error_code(core::errc::data_too_long);
    out.error_message =
        "Maximum data length is " + std::to_string(core::kMaxDataLength) + " characters";
    return false;
  }

  out.symbology = entry->sym;
  Mode mode = entry->mode;

  if (entry->sym == Symbology::ean13 || entry->sym == Symbology::ean8) {
    const std::size_t primary_len = entry->sym == Symbology::ean13 ? 13 : 8;
    if (data.size() < primary_len) {
      return fail(out, errc::primary_scan_data_too_short, "Primary scan data is too short");
    }

    const std::string_view rest = data.substr(primary_len);
    const bool has_cc = rest.size() > kCompositeSymId.size() &&
                        rest.front() == core::kCompositeSeparator &&
                        rest.substr(1, kCompositeSymId.size()) == kCompositeSymId;
    if (!rest.empty() && !has_cc) {
      return fail(out, errc::primary_message_too_long, "Primary message is too long");
    }

    const std::string_view primary = data.substr(0, primary_len);
    if (!core::all_digits(primary)) {
      return fail(out, errc::primary_message_not_digits,
                  "Primary message may only contain digits");
    }
    if (!lint::verify_check_digit(primary)) {
      return fail(out, errc::primary_message_check_digit_incorrect,
                  "Primary message check digit is incorrect");
    }

    out.data_str.assign(primary);
    if (!has_cc) {
      return true;
    }

    // 复合部分按 AI 数据处理
    out.data_str.push_back(core::kCompositeSeparator);
    data = rest.substr(1 + kCompositeSymId.size());
    mode = Mode::ai;
  }

  if (mode == Mode::ai) {
    // 数据中的 '^' 会与 FNC1 混淆
    if (data.find(core::kFnc1) != std::string_view::npos) {
      return fail(out, errc::illegal_carat, "Scan data contains illegal ^ character");
    }
    out.data_str.push_back(core::kFnc1);
    for (const char c : data) {
      out.data_str.push_back(c == core::kGroupSeparator ? core::kFnc1 : c);
    }
    return true;
  }

  // 非 AI 数据以 "\" 转义开头的 "^"，避免被当作 AI 数据
  const std::size_t first = data.find_first_not_of('\\');
  if (first != std::string_view::npos && data[first] == core::kFnc1) {
    out.data_str.push_back('\\');
  }
  out.data_str.append(data);
  return true;
}

}  // namespace

const std::error_category& error_category() noexcept {
  static ScanErrorCategory category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

EncodeResult encode_scan_data(Symbology sym, std::string_view data_str,
                              const ai::ElementSequence& elements, bool add_check_digit) {
  EncodeResult result;
  encode(result, sym, data_str, elements, add_check_digit);
  return result;
}

DecodeResult decode_scan_data(std::string_view scan_data) {
  DecodeResult result;
  decode(result, scan_data);
  return result;
}

}  // namespace gs1::scan
