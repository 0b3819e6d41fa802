#include "gs1/ai/validator.hpp"

#include "gs1/core/error.hpp"

#include <map>
#include <utility>

namespace gs1::ai {

namespace {

constexpr std::array<std::string_view, kNumValidations> kValidationNames{
    "mutex_ais",
    "requisite_ais",
    "repeated_ais",
    "digsig_serial_key",
    "unknown_ai_not_dl_attr",
};

// 带数字签名 (8030) 时必须携带序列号部分的主键
constexpr std::array<std::string_view, 3> kSerialisableKeys{"253", "255", "8003"};

constexpr std::string_view kDigitalSignatureAI = "8030";

[[nodiscard]] std::size_t index_of(Validation v) noexcept {
  return static_cast<std::size_t>(v);
}

[[nodiscard]] ValidationResult failure(errc e, std::string message) {
  return ValidationResult{make_error_code(e), std::move(message)};
}

[[nodiscard]] ValidationResult validate_mutex(const ElementSequence& elements) {
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    for (const auto& pattern : e.entry->exclusions) {
      if (const Element* other = find_ai(elements, pattern, e.ai)) {
        return failure(errc::mutex_ais, "It is invalid to pair AI (" + e.ai + ") with AI (" +
                                            other->ai + "): mutually exclusive AIs");
      }
    }
  }
  return {};
}

[[nodiscard]] ValidationResult validate_requisites(const ElementSequence& elements) {
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    for (const auto& req : e.entry->requisites) {
      bool satisfied = false;
      for (const auto& alternative : req.alternatives) {
        bool all_present = true;
        for (const auto& ai : alternative) {
          if (find_ai(elements, ai, e.ai) == nullptr) {
            all_present = false;
            break;
          }
        }
        if (all_present) {
          satisfied = true;
          break;
        }
      }
      if (!satisfied) {
        return failure(errc::requisite_not_satisfied,
                       "Required AIs for AI (" + e.ai + ") are not satisfied: " + req.text);
      }
    }
  }
  return {};
}

[[nodiscard]] ValidationResult validate_repeats(const ElementSequence& elements) {
  // 同一 AI 重复出现时值必须相同
  std::map<std::string_view, std::string_view> seen;
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    const auto [it, inserted] = seen.emplace(e.ai, e.value);
    if (!inserted && it->second != e.value) {
      return failure(errc::repeated_ai,
                     "Multiple instances of AI (" + e.ai + "): repeated AI not permitted");
    }
  }
  return {};
}

[[nodiscard]] ValidationResult validate_digsig_serial(const ElementSequence& elements) {
  if (find_ai(elements, kDigitalSignatureAI) == nullptr) {
    return {};
  }
  for (const auto& e : elements) {
    if (e.kind != ElementKind::ai_value) {
      continue;
    }
    for (const auto key : kSerialisableKeys) {
      // 值长度等于最短长度即缺少可选的序列号组件
      if (e.ai == key && e.value.size() == e.entry->min_length()) {
        return failure(errc::serial_not_present,
                       "Serial component must be present for AI (" + e.ai +
                           ") when used with AI (8030)");
      }
    }
  }
  return {};
}

}  // namespace

std::optional<Validation> validation_from_index(int index) noexcept {
  if (index < 0 || index >= static_cast<int>(kNumValidations)) {
    return std::nullopt;
  }
  return static_cast<Validation>(index);
}

std::string_view validation_name(Validation v) noexcept {
  const auto i = index_of(v);
  return i < kValidationNames.size() ? kValidationNames[i] : std::string_view{};
}

ValidationTable::ValidationTable() noexcept { enabled_.fill(true); }

bool ValidationTable::enabled(Validation v) const noexcept {
  const auto i = index_of(v);
  return i < enabled_.size() && enabled_[i];
}

bool ValidationTable::locked(Validation v) noexcept {
  return v == Validation::mutex_ais || v == Validation::repeated_ais;
}

std::error_code ValidationTable::set_enabled(Validation v, bool enabled) noexcept {
  const auto i = index_of(v);
  if (i >= enabled_.size()) {
    return core::make_error_code(core::errc::unknown_validation);
  }
  if (locked(v) && enabled_[i] != enabled) {
    return core::make_error_code(core::errc::validation_locked);
  }
  enabled_[i] = enabled;
  return {};
}

ValidationResult validate(const ElementSequence& elements, const ValidationTable& table) {
  if (table.enabled(Validation::mutex_ais)) {
    if (auto r = validate_mutex(elements); r.ec) {
      return r;
    }
  }
  if (table.enabled(Validation::requisite_ais)) {
    if (auto r = validate_requisites(elements); r.ec) {
      return r;
    }
  }
  if (table.enabled(Validation::repeated_ais)) {
    if (auto r = validate_repeats(elements); r.ec) {
      return r;
    }
  }
  if (table.enabled(Validation::digsig_serial_key)) {
    if (auto r = validate_digsig_serial(elements); r.ec) {
      return r;
    }
  }
  return {};
}

}  // namespace gs1::ai
