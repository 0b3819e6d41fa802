#pragma once

#include "gs1/ai/element.hpp"
#include "gs1/ai/validator.hpp"
#include "gs1/dict/ai_table.hpp"
#include "gs1/scan/symbology.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gs1 {

/**
 * @brief 最近一次失败的类别。
 *
 * 由错误码的错误域归类：gs1.dl 为 digital_link，gs1.scan 为 scan_data，
 * 其它输入类错误为 parameter；initialization 表示语法字典无法加载。
 */
enum class ErrorKind : std::uint8_t {
  none = 0,
  initialization = 1,
  parameter = 2,
  digital_link = 3,
  scan_data = 4,
};

struct EncoderOptions final {
  scan::Symbology symbology{scan::Symbology::none};

  // 校验位缺失时计算补齐（AI 数据与 EAN/UPC、DataBar 主数据）
  bool add_check_digit{false};

  // 放行语法表中没有的 AI（按两位前缀推断长度）
  bool permit_unknown_ais{false};

  // DL URI 路径中的 (01) 允许 8/12/13 位零抑制形式
  bool permit_zero_suppressed_gtin_in_dl_uris{false};

  // DL URI 路径中允许 "gtin"、"lot" 等便捷别名
  bool permit_convenience_alphas_in_dl_uris{false};

  // HRI 每行前加 AI 标题
  bool include_data_titles_in_hri{false};

  // 各校验规则的初始开关（按 ai::Validation 取值索引）；锁定规则始终启用
  std::array<bool, ai::kNumValidations> validations{true, true, true, true, true};
};

/**
 * @brief 编码上下文：持有一份已提交的元素序列及其派生视图。
 *
 * 所有 set_* 都是原子的：解析或校验失败时保留之前提交的状态（含码制），
 * 只记录错误消息与错误标记。派生视图（HRI、DL URI、扫描数据、括号 AI 串）
 * 每次调用时重新计算。
 *
 * 说明：
 * - 单个 Encoder 不是线程安全的；不同 Encoder 之间不共享可变状态。
 * - 每次 set_*、load_syntax_dictionary 以及可能失败的派生视图都会先清空错误状态。
 */
class Encoder final {
 public:
  Encoder();
  explicit Encoder(EncoderOptions options);

  [[nodiscard]] static std::string_view version() noexcept;

  // 内嵌语法字典加载失败时为 false，此后所有输入操作都会失败
  [[nodiscard]] bool initialized() const noexcept { return table_ != nullptr; }

  [[nodiscard]] scan::Symbology symbology() const noexcept { return symbology_; }
  std::error_code set_symbology(scan::Symbology sym);

  [[nodiscard]] bool add_check_digit() const noexcept { return options_.add_check_digit; }
  void set_add_check_digit(bool enabled) noexcept;

  [[nodiscard]] bool permit_unknown_ais() const noexcept { return options_.permit_unknown_ais; }
  void set_permit_unknown_ais(bool enabled) noexcept;

  [[nodiscard]] bool permit_zero_suppressed_gtin_in_dl_uris() const noexcept {
    return options_.permit_zero_suppressed_gtin_in_dl_uris;
  }
  void set_permit_zero_suppressed_gtin_in_dl_uris(bool enabled) noexcept;

  [[nodiscard]] bool permit_convenience_alphas_in_dl_uris() const noexcept {
    return options_.permit_convenience_alphas_in_dl_uris;
  }
  void set_permit_convenience_alphas_in_dl_uris(bool enabled) noexcept;

  [[nodiscard]] bool include_data_titles_in_hri() const noexcept {
    return options_.include_data_titles_in_hri;
  }
  void set_include_data_titles_in_hri(bool enabled) noexcept;

  [[nodiscard]] bool validation_enabled(ai::Validation v) const noexcept {
    return validations_.enabled(v);
  }
  std::error_code set_validation_enabled(ai::Validation v, bool enabled);

  /**
   * @brief 用文件中的语法字典替换当前语法表。
   *
   * 成功后已提交的数据被清空（元素引用的是旧表）；失败时保持原状。
   */
  std::error_code load_syntax_dictionary(const std::string& path);

  [[nodiscard]] const std::string& data_str() const noexcept { return data_str_; }

  /**
   * @brief 设置数据串：'^' 开头的 AI 数据、含 '|' 的复合数据、DL URI 或非 AI 数据。
   */
  std::error_code set_data_str(std::string_view data);

  /**
   * @brief 当前数据的括号 AI 形式；非 AI 数据返回 std::nullopt。
   */
  [[nodiscard]] std::optional<std::string> ai_data_str() const;
  std::error_code set_ai_data_str(std::string_view ai_data);

  /**
   * @brief 按当前码制生成扫描数据；失败时记录错误并返回 std::nullopt。
   */
  [[nodiscard]] std::optional<std::string> scan_data();
  std::error_code set_scan_data(std::string_view scan_data);

  /**
   * @brief 生成 DL URI；stem 缺省为 https://id.gs1.org。
   */
  [[nodiscard]] std::optional<std::string> dl_uri(std::optional<std::string_view> stem = std::nullopt);

  [[nodiscard]] std::vector<std::string> hri() const;
  [[nodiscard]] std::vector<std::string> dl_ignored_query_params() const;

  [[nodiscard]] const ai::ElementSequence& elements() const noexcept { return elements_; }

  [[nodiscard]] const std::string& err_msg() const noexcept { return err_msg_; }
  [[nodiscard]] const std::string& err_markup() const noexcept { return err_markup_; }
  [[nodiscard]] ErrorKind error_kind() const noexcept { return error_kind_; }
  [[nodiscard]] std::error_code last_error() const noexcept { return last_error_; }

 private:
  struct Staged final {
    ai::ElementSequence elements{};
    std::string data_str{};
    std::error_code ec{};
    std::string error_message{};
    std::string error_markup{};
  };

  [[nodiscard]] Staged stage_data_str_(std::string_view data) const;
  void validate_staged_(Staged& staged) const;
  std::error_code commit_(Staged staged, std::string_view operation);

  void reset_error_() noexcept;
  std::error_code record_error_(std::error_code ec,
                                std::string message,
                                std::string markup,
                                std::string_view operation);
  [[nodiscard]] std::error_code require_table_(std::string_view operation);

  EncoderOptions options_{};
  scan::Symbology symbology_{scan::Symbology::none};
  ai::ValidationTable validations_{};

  std::shared_ptr<const dict::AiTable> table_{};

  ai::ElementSequence elements_{};
  std::string data_str_{};

  std::error_code last_error_{};
  ErrorKind error_kind_{ErrorKind::none};
  std::string err_msg_{};
  std::string err_markup_{};
};

}  // namespace gs1
