#include "gs1/dict/ai_table.hpp"

#include "gs1/core/common.hpp"

#include <algorithm>
#include <utility>

namespace gs1::dict {

namespace {

// 预定义定长 AI 的取值长度（按两位前缀），0 表示变长。
// 用于推断未知 AI 的取值长度：部分前缀尚未分配具体 AI。
constexpr std::array<std::uint8_t, 100> kFixedValueLengthByPrefix{
    18, 14, 14, 14, 16, 0, 0, 0, 0, 0,  // 00-09
    0,  6,  6,  6,  6,  6, 6, 6, 6, 6,  // 10-19
    2,  0,  0,  0,  0,  0, 0, 0, 0, 0,  // 20-29
    0,  6,  6,  6,  6,  6, 6, 0, 0, 0,  // 30-39
    0,  13, 0,  0,  0,  0, 0, 0, 0, 0,  // 40-49
};

constexpr std::string_view kUnknownTitle = "UNKNOWN";

[[nodiscard]] std::size_t prefix_index(std::string_view ai) noexcept {
    return static_cast<std::size_t>((ai[0] - '0') * 10 + (ai[1] - '0'));
}

[[nodiscard]] AiEntry make_unknown_entry(std::uint8_t min_length,
                                         std::uint8_t max_length) {
    AiEntry e;
    e.fnc1_required = min_length != max_length;
    e.dl_data_attr = DLDataAttr::unknown_ai;
    e.components.push_back(Component{lint::Cset::cset82, min_length, max_length, false, {}});
    e.title = std::string(kUnknownTitle);
    return e;
}

[[nodiscard]] std::string join_sequence(const std::vector<std::string> &ais) {
    std::string out;
    for (const auto &ai : ais) {
        if (!out.empty()) {
            out.push_back(' ');
        }
        out.append(ai);
    }
    return out;
}

[[nodiscard]] std::vector<std::string> split_sequence(std::string_view s) {
    std::vector<std::string> out;
    while (!s.empty()) {
        const auto sp = s.find(' ');
        out.emplace_back(s.substr(0, sp));
        if (sp == std::string_view::npos) {
            break;
        }
        s.remove_prefix(sp + 1);
    }
    return out;
}

}  // namespace

std::size_t AiEntry::min_length() const noexcept {
    std::size_t n = 0;
    for (const auto &c : components) {
        if (!c.optional) {
            n += c.min_length;
        }
    }
    return n;
}

std::size_t AiEntry::max_length() const noexcept {
    std::size_t n = 0;
    for (const auto &c : components) {
        n += c.max_length;
    }
    return n;
}

AiTable::AiTable(std::vector<AiEntry> entries) : entries_(std::move(entries)) {
    std::sort(entries_.begin(), entries_.end(),
              [](const AiEntry &a, const AiEntry &b) { return a.ai < b.ai; });

    for (const auto &e : entries_) {
        length_by_prefix_[prefix_index(e.ai)] = static_cast<std::uint8_t>(e.ai.size());

        if (!e.dl_primary_key) {
            continue;
        }
        dl_path_sequences_.insert(e.ai);

        // 每个分支：按序取限定符的所有子集，均以主键开头
        for (const auto &group : e.dl_qualifier_groups) {
            std::vector<std::vector<std::string>> seqs{{e.ai}};
            for (const auto &q : group) {
                const std::size_t n = seqs.size();
                for (std::size_t i = 0; i < n; ++i) {
                    auto seq = seqs[i];
                    seq.push_back(q);
                    seqs.push_back(std::move(seq));
                }
            }
            for (const auto &seq : seqs) {
                dl_path_sequences_.insert(join_sequence(seq));
            }
        }
    }

    unknown_entries_.push_back(make_unknown_entry(1, static_cast<std::uint8_t>(core::kMaxAIValueLength)));
    for (const std::uint8_t len : {2, 6, 13, 14, 16, 18}) {
        unknown_entries_.push_back(make_unknown_entry(len, len));
    }
}

const AiEntry *AiTable::find(std::string_view ai) const noexcept {
    const auto it = std::lower_bound(
        entries_.begin(), entries_.end(), ai,
        [](const AiEntry &e, std::string_view key) { return e.ai < key; });
    if (it != entries_.end() && it->ai == ai) {
        return &*it;
    }
    return nullptr;
}

const AiEntry *AiTable::lookup(std::string_view ai,
                               bool permit_unknown) const noexcept {
    if (ai.size() < core::kMinAILength || ai.size() > core::kMaxAILength ||
        !core::all_digits(ai)) {
        return nullptr;
    }

    if (const auto *e = find(ai)) {
        return e;
    }

    // 已知 AI 是其真前缀
    for (std::size_t n = core::kMinAILength; n < ai.size(); ++n) {
        if (find(ai.substr(0, n)) != nullptr) {
            return nullptr;
        }
    }
    // 其本身是某个已知 AI 的真前缀
    const auto it = std::lower_bound(
        entries_.begin(), entries_.end(), ai,
        [](const AiEntry &e, std::string_view key) { return e.ai < key; });
    if (it != entries_.end() && std::string_view(it->ai).substr(0, ai.size()) == ai) {
        return nullptr;
    }

    if (!permit_unknown) {
        return nullptr;
    }

    const auto by_prefix = length_by_prefix(ai);
    if (by_prefix && *by_prefix != ai.size()) {
        return nullptr;
    }
    return unknown_entry(ai, by_prefix ? *by_prefix : 0);
}

AiMatch AiTable::lookup_prefix(std::string_view data,
                               bool permit_unknown) const noexcept {
    if (data.size() < core::kMinAILength ||
        !core::all_digits(data.substr(0, core::kMinAILength))) {
        return {};
    }

    const auto by_prefix = length_by_prefix(data);
    if (!by_prefix) {
        // 无从得知 AI 长度，无法在无分隔的数据中切分
        return {};
    }

    const std::size_t n = *by_prefix;
    if (data.size() < n || !core::all_digits(data.substr(0, n))) {
        return {};
    }
    if (const auto *e = find(data.substr(0, n))) {
        return {e, n};
    }
    if (!permit_unknown) {
        return {};
    }
    return {unknown_entry(data, n), n};
}

std::optional<std::size_t>
AiTable::length_by_prefix(std::string_view ai) const noexcept {
    if (ai.size() < core::kMinAILength || !core::is_digit(ai[0]) ||
        !core::is_digit(ai[1])) {
        return std::nullopt;
    }
    const auto len = length_by_prefix_[prefix_index(ai)];
    if (len == 0) {
        return std::nullopt;
    }
    return len;
}

bool AiTable::is_dl_primary_key(std::string_view ai) const noexcept {
    const auto *e = find(ai);
    return e != nullptr && e->dl_primary_key;
}

bool AiTable::is_valid_dl_path_sequence(const std::vector<std::string> &ais) const {
    return dl_path_sequences_.count(join_sequence(ais)) != 0;
}

std::vector<std::vector<std::string>>
AiTable::qualifier_sequences(std::string_view key) const {
    std::vector<std::vector<std::string>> out;
    for (auto it = dl_path_sequences_.lower_bound(std::string(key));
         it != dl_path_sequences_.end(); ++it) {
        auto seq = split_sequence(*it);
        if (seq.front() != key) {
            break;
        }
        out.push_back(std::move(seq));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const auto &a, const auto &b) { return a.size() > b.size(); });
    return out;
}

const AiEntry *AiTable::unknown_entry(std::string_view ai,
                                      std::size_t ai_length) const noexcept {
    const std::uint8_t value_length =
        ai_length == 0 ? 0 : kFixedValueLengthByPrefix[prefix_index(ai)];

    bool fixed = false;
    switch (ai_length) {
    case 2:
        fixed = value_length == 2 || value_length == 14 || value_length == 16 ||
                value_length == 18;
        break;
    case 3:
        fixed = value_length == 13;
        break;
    case 4:
        fixed = value_length == 6;
        break;
    default:
        break;
    }

    if (fixed) {
        for (const auto &e : unknown_entries_) {
            if (e.is_fixed_length() && e.max_length() == value_length) {
                return &e;
            }
        }
    }
    return &unknown_entries_.front();
}

}  // namespace gs1::dict
