#pragma once

#include "gs1/lint/linters.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gs1::dict {

/**
 * @brief AI 组件：字符集 + 长度范围 + 可选标记 + linter 列表。
 *
 * 只有最后一个组件允许变长（min_length < max_length）；
 * 可选组件只能出现在尾部。
 */
struct Component final {
    lint::Cset cset{lint::Cset::numeric};
    std::uint8_t min_length{0};
    std::uint8_t max_length{0};
    bool optional{false};
    std::vector<lint::Linter> linters;

    friend bool operator==(const Component &, const Component &) = default;
};

/**
 * @brief AI 能否作为 DL URI 查询参数（数据属性）出现。
 *
 * unknown_ai：被“放行”的未知 AI，是否可作为数据属性取决于
 * Unknown-AI-not-a-DL-attribute 校验开关。
 */
enum class DLDataAttr : std::uint8_t {
    no = 0,
    yes = 1,
    unknown_ai = 2,
};

/**
 * @brief 一条 req= 属性：alternatives 中至少一组满足（组内 AI 必须全部出现）。
 */
struct Requisite final {
    std::string text;
    std::vector<std::vector<std::string>> alternatives;

    friend bool operator==(const Requisite &, const Requisite &) = default;
};

struct AiEntry final {
    std::string ai;
    bool fnc1_required{true};
    DLDataAttr dl_data_attr{DLDataAttr::no};
    std::vector<Component> components;
    std::vector<Requisite> requisites;
    // ex= 列表；末位 'n' 匹配任意数字
    std::vector<std::string> exclusions;
    // dlpkey 属性：是否为主键，以及每个 '|' 分支的有序可选限定符
    bool dl_primary_key{false};
    std::vector<std::vector<std::string>> dl_qualifier_groups;
    std::string title;

    [[nodiscard]] std::size_t min_length() const noexcept;
    [[nodiscard]] std::size_t max_length() const noexcept;
    [[nodiscard]] bool is_fixed_length() const noexcept {
        return min_length() == max_length();
    }
    [[nodiscard]] bool is_unknown() const noexcept { return ai.empty(); }
};

/**
 * @brief 前缀查找结果：entry 为空表示未找到；ai_length 为数据开头 AI 的位数。
 */
struct AiMatch final {
    const AiEntry *entry{nullptr};
    std::size_t ai_length{0};

    [[nodiscard]] explicit operator bool() const noexcept {
        return entry != nullptr;
    }
};

/**
 * @brief AI 语法表（只读）。
 *
 * 由语法字典加载得到（见 syntax_dictionary.hpp），构造后不可修改。
 * 除已知 AI 外，表内还持有若干“未知 AI”占位条目：在允许未知 AI 时，
 * 按两位前缀推断出的 AI 长度与预定义定长返回对应占位条目。
 */
class AiTable final {
public:
    /**
     * @brief 由已校验的条目构造（调用方保证无重复、两位前缀长度一致）。
     */
    explicit AiTable(std::vector<AiEntry> entries);

    AiTable(const AiTable &) = delete;
    AiTable &operator=(const AiTable &) = delete;

    /**
     * @brief 精确查找已知 AI（不产生未知 AI 占位条目）。
     */
    [[nodiscard]] const AiEntry *find(std::string_view ai) const noexcept;

    /**
     * @brief 查找一个完整的 AI（2~4 位数字）。
     *
     * 已知 AI 精确匹配时返回其条目；若已知 AI 与之互为前缀则冲突、返回空；
     * permit_unknown 为 true 时，长度与两位前缀推断一致（或无从推断）则返回
     * 未知 AI 占位条目。
     */
    [[nodiscard]] const AiEntry *lookup(std::string_view ai,
                                        bool permit_unknown) const noexcept;

    /**
     * @brief 在数据开头查找 AI（用于无分隔的 element string）。
     *
     * 未知 AI 仅在两位前缀能推断 AI 长度时才会被放行。
     */
    [[nodiscard]] AiMatch lookup_prefix(std::string_view data,
                                        bool permit_unknown) const noexcept;

    /**
     * @brief 两位前缀对应的 AI 长度；没有已知 AI 以此开头时返回 std::nullopt。
     */
    [[nodiscard]] std::optional<std::size_t>
    length_by_prefix(std::string_view ai) const noexcept;

    [[nodiscard]] bool is_dl_primary_key(std::string_view ai) const noexcept;

    /**
     * @brief 判断 DL 路径中的 AI 序列（主键在前）是否为合法的主键/限定符组合。
     */
    [[nodiscard]] bool
    is_valid_dl_path_sequence(const std::vector<std::string> &ais) const;

    /**
     * @brief 主键 key 的全部合法路径序列（均以 key 开头，按限定符个数从多到少）。
     */
    [[nodiscard]] std::vector<std::vector<std::string>>
    qualifier_sequences(std::string_view key) const;

    [[nodiscard]] const std::vector<AiEntry> &entries() const noexcept {
        return entries_;
    }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    [[nodiscard]] const AiEntry *unknown_entry(std::string_view ai,
                                               std::size_t ai_length) const noexcept;

    std::vector<AiEntry> entries_;  // 按 AI 排序
    std::array<std::uint8_t, 100> length_by_prefix_{};
    // 空格连接的 "key q1 q2" 序列
    std::set<std::string> dl_path_sequences_;
    // [0] 变长，其余为预定义定长（2/6/13/14/16/18）
    std::vector<AiEntry> unknown_entries_;
};

}  // 命名空间 gs1::dict
