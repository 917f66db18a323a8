#include "grading/output_comparison.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace grader {
using namespace std;

// 超过这个规模的差异不再计算最长公共子序列，直接输出整块的删除和插入
static constexpr size_t MAX_DIFF_CELLS = 16 * 1024 * 1024;

struct line {
    string text;  // 原始的行，包含换行符
    string key;   // 按照忽略规则规范化后的行，用于比较
};

static vector<string> split_lines(const string &content) {
    vector<string> lines;
    size_t begin = 0;
    while (begin < content.size()) {
        size_t end = content.find('\n', begin);
        if (end == string::npos) end = content.size() - 1;
        lines.push_back(content.substr(begin, end - begin + 1));
        begin = end + 1;
    }
    return lines;
}

static string normalize(const string &text, const comparison_flags &flags) {
    string key;
    key.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        unsigned char c = (unsigned char)ch;
        if (isspace(c)) {
            if (flags.ignore_whitespace) continue;
            if (flags.ignore_whitespace_changes) {
                pending_space = true;
                continue;
            }
        } else if (pending_space) {
            if (!key.empty()) key.push_back(' ');
            pending_space = false;
        }
        key.push_back(flags.ignore_case ? (char)tolower(c) : ch);
    }
    // ignore_whitespace_changes 时行首空白数量的变化也被视为一个空格
    if (flags.ignore_whitespace_changes && !text.empty() && isspace((unsigned char)text[0]) && !key.empty())
        key.insert(key.begin(), ' ');
    return key;
}

static bool is_blank(const line &l) {
    return all_of(l.text.begin(), l.text.end(), [](char c) { return c == '\n' || c == '\r'; });
}

static vector<line> prepare(const string &content, const comparison_flags &flags) {
    vector<line> lines;
    for (auto &text : split_lines(content)) {
        line l{text, normalize(text, flags)};
        if (flags.ignore_blank_lines && is_blank(l)) continue;
        lines.push_back(move(l));
    }
    return lines;
}

bool outputs_equal(const string &expected, const string &actual, const comparison_flags &flags) {
    vector<line> a = prepare(expected, flags), b = prepare(actual, flags);
    return equal(a.begin(), a.end(), b.begin(), b.end(),
                 [](const line &x, const line &y) { return x.key == y.key; });
}

vector<string> diff_lines(const string &expected, const string &actual, const comparison_flags &flags) {
    vector<line> a = prepare(expected, flags), b = prepare(actual, flags);
    vector<string> result;

    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix].key == b[prefix].key) ++prefix;
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix].key == b[b.size() - 1 - suffix].key)
        ++suffix;

    for (size_t i = 0; i < prefix; ++i) result.push_back("  " + a[i].text);

    size_t n = a.size() - prefix - suffix, m = b.size() - prefix - suffix;
    if (n * m > MAX_DIFF_CELLS) {
        for (size_t i = 0; i < n; ++i) result.push_back("- " + a[prefix + i].text);
        for (size_t j = 0; j < m; ++j) result.push_back("+ " + b[prefix + j].text);
    } else {
        // lcs[i][j] 为 a[i..] 和 b[j..] 的最长公共子序列长度
        vector<uint32_t> lcs((n + 1) * (m + 1), 0);
        auto at = [&](size_t i, size_t j) -> uint32_t & { return lcs[i * (m + 1) + j]; };
        for (size_t i = n; i-- > 0;)
            for (size_t j = m; j-- > 0;)
                at(i, j) = a[prefix + i].key == b[prefix + j].key
                               ? at(i + 1, j + 1) + 1
                               : max(at(i + 1, j), at(i, j + 1));

        size_t i = 0, j = 0;
        while (i < n && j < m) {
            if (a[prefix + i].key == b[prefix + j].key) {
                result.push_back("  " + a[prefix + i].text);
                ++i, ++j;
            } else if (at(i + 1, j) >= at(i, j + 1)) {
                result.push_back("- " + a[prefix + i].text);
                ++i;
            } else {
                result.push_back("+ " + b[prefix + j].text);
                ++j;
            }
        }
        for (; i < n; ++i) result.push_back("- " + a[prefix + i].text);
        for (; j < m; ++j) result.push_back("+ " + b[prefix + j].text);
    }

    for (size_t i = a.size() - suffix; i < a.size(); ++i) result.push_back("  " + a[i].text);
    return result;
}

}  // namespace grader
