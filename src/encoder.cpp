#include "gs1/encoder.hpp"

#include "gs1/ai/hri.hpp"
#include "gs1/ai/parser.hpp"
#include "gs1/core/common.hpp"
#include "gs1/core/error.hpp"
#include "gs1/dict/syntax_dictionary.hpp"
#include "gs1/dl/uri.hpp"
#include "gs1/scan/scan_data.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <utility>

#ifndef GS1_VERSION_STRING
#define GS1_VERSION_STRING "1.0.0"
#endif

namespace gs1 {
namespace {

[[nodiscard]] ErrorKind classify(const std::error_code& ec) noexcept {
  if (!ec) {
    return ErrorKind::none;
  }
  const char* name = ec.category().name();
  if (std::strcmp(name, dl::error_category().name()) == 0) {
    return ErrorKind::digital_link;
  }
  if (std::strcmp(name, scan::error_category().name()) == 0) {
    return ErrorKind::scan_data;
  }
  return ErrorKind::parameter;
}

}  // namespace

Encoder::Encoder() : Encoder(EncoderOptions{}) {}

Encoder::Encoder(EncoderOptions options) : options_(options) {
  if (scan::symbology_from_index(static_cast<int>(options.symbology))) {
    symbology_ = options.symbology;
  }

  for (std::size_t i = 0; i < ai::kNumValidations; ++i) {
    const auto v = ai::validation_from_index(static_cast<int>(i));
    if (v && !ai::ValidationTable::locked(*v)) {
      (void)validations_.set_enabled(*v, options.validations[i]);
    }
  }

  auto loaded = dict::load_embedded_syntax_dictionary();
  if (loaded.ec) {
    last_error_ = loaded.ec;
    error_kind_ = ErrorKind::initialization;
    err_msg_ = std::move(loaded.error_message);
    spdlog::error("gs1 encoder: embedded syntax dictionary rejected: {}", err_msg_);
    return;
  }
  table_ = std::move(loaded.table);
}

std::string_view Encoder::version() noexcept { return GS1_VERSION_STRING; }

void Encoder::reset_error_() noexcept {
  last_error_.clear();
  error_kind_ = ErrorKind::none;
  err_msg_.clear();
  err_markup_.clear();
}

std::error_code Encoder::record_error_(std::error_code ec,
                                       std::string message,
                                       std::string markup,
                                       std::string_view operation) {
  last_error_ = ec;
  error_kind_ = classify(ec);
  err_msg_ = message.empty() ? ec.message() : std::move(message);
  err_markup_ = std::move(markup);
  spdlog::debug("gs1 encoder: {} rejected: [{}] {}", operation, ec.category().name(), err_msg_);
  return ec;
}

std::error_code Encoder::require_table_(std::string_view operation) {
  if (table_) {
    return {};
  }
  const auto ec = core::make_error_code(core::errc::initialization_failed);
  record_error_(ec, "Syntax dictionary is not loaded", {}, operation);
  error_kind_ = ErrorKind::initialization;
  return ec;
}

std::error_code Encoder::set_symbology(scan::Symbology sym) {
  reset_error_();
  if (!scan::symbology_from_index(static_cast<int>(sym))) {
    return record_error_(core::make_error_code(core::errc::unknown_symbology),
                         "Unknown symbology", {}, "set_symbology");
  }
  symbology_ = sym;
  return {};
}

void Encoder::set_add_check_digit(bool enabled) noexcept {
  reset_error_();
  options_.add_check_digit = enabled;
}

void Encoder::set_permit_unknown_ais(bool enabled) noexcept {
  reset_error_();
  options_.permit_unknown_ais = enabled;
}

void Encoder::set_permit_zero_suppressed_gtin_in_dl_uris(bool enabled) noexcept {
  reset_error_();
  options_.permit_zero_suppressed_gtin_in_dl_uris = enabled;
}

void Encoder::set_permit_convenience_alphas_in_dl_uris(bool enabled) noexcept {
  reset_error_();
  options_.permit_convenience_alphas_in_dl_uris = enabled;
}

void Encoder::set_include_data_titles_in_hri(bool enabled) noexcept {
  reset_error_();
  options_.include_data_titles_in_hri = enabled;
}

std::error_code Encoder::set_validation_enabled(ai::Validation v, bool enabled) {
  reset_error_();
  if (auto ec = validations_.set_enabled(v, enabled)) {
    return record_error_(ec, "This validation cannot be amended", {}, "set_validation_enabled");
  }
  return {};
}

std::error_code Encoder::load_syntax_dictionary(const std::string& path) {
  reset_error_();
  auto loaded = dict::load_syntax_dictionary_file(path);
  if (loaded.ec) {
    return record_error_(loaded.ec, std::move(loaded.error_message), {},
                         "load_syntax_dictionary");
  }
  table_ = std::move(loaded.table);
  elements_.clear();
  data_str_.clear();
  return {};
}

Encoder::Staged Encoder::stage_data_str_(std::string_view data) const {
  Staged staged;

  if (data.size() > core::kMaxDataLength) {
    staged.ec = core::make_error_code(core::errc::data_too_long);
    staged.error_message =
        "Maximum data length is " + std::to_string(core::kMaxDataLength) + " characters";
    return staged;
  }

  if (dl::is_dl_uri(data)) {
    dl::ParseOptions dl_options;
    dl_options.permit_unknown_ais = options_.permit_unknown_ais;
    dl_options.permit_zero_suppressed_gtin = options_.permit_zero_suppressed_gtin_in_dl_uris;
    dl_options.permit_convenience_alphas = options_.permit_convenience_alphas_in_dl_uris;
    dl_options.unknown_ai_not_dl_attr =
        validations_.enabled(ai::Validation::unknown_ai_not_dl_attr);

    auto parsed = dl::parse_uri(*table_, data, dl_options);
    staged.ec = parsed.ec;
    staged.error_message = std::move(parsed.error_message);
    staged.error_markup = std::move(parsed.error_markup);
    if (!staged.ec) {
      staged.elements = std::move(parsed.elements);
      staged.data_str.assign(data);
    }
  } else {
    ai::ParseOptions ai_options;
    ai_options.permit_unknown_ais = options_.permit_unknown_ais;
    ai_options.add_check_digit = options_.add_check_digit;

    auto parsed = ai::Parser(*table_, ai_options).parse_data_str(data);
    staged.ec = parsed.ec;
    staged.error_message = std::move(parsed.error_message);
    staged.error_markup = std::move(parsed.error_markup);
    if (!staged.ec) {
      staged.elements = std::move(parsed.elements);
      staged.data_str = std::move(parsed.data_str);
    }
  }

  if (!staged.ec) {
    validate_staged_(staged);
  }
  return staged;
}

void Encoder::validate_staged_(Staged& staged) const {
  auto result = ai::validate(staged.elements, validations_);
  if (result.ec) {
    staged.ec = result.ec;
    staged.error_message = std::move(result.error_message);
  }
}

std::error_code Encoder::commit_(Staged staged, std::string_view operation) {
  if (staged.ec) {
    return record_error_(staged.ec, std::move(staged.error_message),
                         std::move(staged.error_markup), operation);
  }
  elements_ = std::move(staged.elements);
  data_str_ = std::move(staged.data_str);
  return {};
}

std::error_code Encoder::set_data_str(std::string_view data) {
  reset_error_();
  if (auto ec = require_table_("set_data_str")) {
    return ec;
  }
  return commit_(stage_data_str_(data), "set_data_str");
}

std::error_code Encoder::set_ai_data_str(std::string_view ai_data) {
  reset_error_();
  if (auto ec = require_table_("set_ai_data_str")) {
    return ec;
  }

  ai::ParseOptions ai_options;
  ai_options.permit_unknown_ais = options_.permit_unknown_ais;
  ai_options.add_check_digit = options_.add_check_digit;

  auto parsed = ai::Parser(*table_, ai_options).parse_ai_data_str(ai_data);

  Staged staged;
  staged.ec = parsed.ec;
  staged.error_message = std::move(parsed.error_message);
  staged.error_markup = std::move(parsed.error_markup);
  if (!staged.ec) {
    staged.elements = std::move(parsed.elements);
    staged.data_str = std::move(parsed.data_str);
    validate_staged_(staged);
  }
  return commit_(std::move(staged), "set_ai_data_str");
}

std::optional<std::string> Encoder::ai_data_str() const { return ai::to_bracketed(elements_); }

std::optional<std::string> Encoder::scan_data() {
  reset_error_();
  auto encoded =
      scan::encode_scan_data(symbology_, data_str_, elements_, options_.add_check_digit);
  if (encoded.ec) {
    record_error_(encoded.ec, std::move(encoded.error_message), {}, "scan_data");
    return std::nullopt;
  }
  return std::move(encoded.scan_data);
}

std::error_code Encoder::set_scan_data(std::string_view scan_data) {
  reset_error_();
  if (auto ec = require_table_("set_scan_data")) {
    return ec;
  }

  auto decoded = scan::decode_scan_data(scan_data);
  if (decoded.ec) {
    return record_error_(decoded.ec, std::move(decoded.error_message), {}, "set_scan_data");
  }

  auto staged = stage_data_str_(decoded.data_str);
  if (auto ec = commit_(std::move(staged), "set_scan_data")) {
    return ec;
  }
  symbology_ = decoded.symbology;
  return {};
}

std::optional<std::string> Encoder::dl_uri(std::optional<std::string_view> stem) {
  reset_error_();
  if (require_table_("dl_uri")) {
    return std::nullopt;
  }

  auto built = dl::build_uri(*table_, elements_, stem,
                             validations_.enabled(ai::Validation::unknown_ai_not_dl_attr));
  if (built.ec) {
    record_error_(built.ec, std::move(built.error_message), {}, "dl_uri");
    return std::nullopt;
  }
  return std::move(built.uri);
}

std::vector<std::string> Encoder::hri() const {
  return ai::render_hri(elements_, options_.include_data_titles_in_hri);
}

std::vector<std::string> Encoder::dl_ignored_query_params() const {
  return ai::dl_ignored_query_params(elements_);
}

}  // namespace gs1
