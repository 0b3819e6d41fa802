#include "gs1/ai/element.hpp"

#include "gs1/core/common.hpp"

#include <utility>

namespace gs1::ai {

namespace {

class AiErrorCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "gs1.ai"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::missing_fnc1:
        return "missing FNC1 in first position";
      case errc::empty_data:
        return "AI data is empty";
      case errc::no_ai_for_prefix:
        return "no known AI is a prefix of the data";
      case errc::unrecognised_ai:
        return "unrecognised AI";
      case errc::value_empty:
        return "AI value is empty";
      case errc::incorrect_length:
        return "AI value has incorrect length";
      case errc::value_too_short:
        return "AI value is too short";
      case errc::value_too_long:
        return "AI value is too long";
      case errc::missing_separator:
        return "AI data is too long";
      case errc::illegal_carat:
        return "AI value contains illegal ^ character";
      case errc::too_many_ais:
        return "too many AIs";
      case errc::malformed_ai_data:
        return "failed to parse AI data";
      case errc::mutex_ais:
        return "mutually exclusive AIs";
      case errc::requisite_not_satisfied:
        return "required AIs are not satisfied";
      case errc::repeated_ai:
        return "repeated AI not permitted";
      case errc::serial_not_present:
        return "serial component must be present";
    }
    return "unknown gs1.ai error";
  }
};

const AiErrorCategory kAiErrorCategory{};

[[nodiscard]] bool matches_pattern(std::string_view ai, std::string_view pattern) noexcept {
  if (ai.size() != pattern.size()) {
    return false;
  }
  for (std::size_t i = 0; i < ai.size(); ++i) {
    if (pattern[i] == 'n' ? !core::is_digit(ai[i]) : pattern[i] != ai[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

const std::error_category& error_category() noexcept { return kAiErrorCategory; }

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

Element make_ai_element(const dict::AiEntry& entry, std::string ai, std::string value) {
  Element e;
  e.kind = ElementKind::ai_value;
  e.entry = &entry;
  e.ai = std::move(ai);
  e.value = std::move(value);
  return e;
}

Element make_composite_separator() {
  Element e;
  e.kind = ElementKind::composite_separator;
  return e;
}

const Element* find_ai(const ElementSequence& elements, std::string_view pattern,
                       std::string_view ignore_ai) noexcept {
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    if (!ignore_ai.empty() && e.ai == ignore_ai) {
      continue;
    }
    if (matches_pattern(e.ai, pattern)) {
      return &e;
    }
  }
  return nullptr;
}

}  // namespace gs1::ai
