/**
 * @file yaml_config.h
 * @brief 轻量级 YAML 配置解析器
 *
 * 支持的 YAML 子集：
 * - 键值对与嵌套对象（按缩进）
 * - 块式列表与流式列表 [a, b]
 * - 流式 map {a: 1, b: 2}
 * - 注释、带引号/不带引号的字符串
 *
 * 另外支持按点分路径覆盖标量，用于 VERIFY_ 环境变量覆盖。
 */

#ifndef SCIV_CORE_YAML_CONFIG_H
#define SCIV_CORE_YAML_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <variant>
#include <memory>
#include <cstdlib>
#include <cerrno>

#include "core/error.h"

namespace sciv {
namespace yaml {

//==============================================================================
// YAML 值类型
//==============================================================================

class Node;
using NodePtr = std::shared_ptr<Node>;
using NodeMap = std::map<std::string, NodePtr>;
using NodeList = std::vector<NodePtr>;
using NodeValue = std::variant<std::monostate, std::string, int64_t, double, bool, NodeMap, NodeList>;

namespace detail {

inline std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

/**
 * @brief 整串解析为整数，失败返回 false
 */
inline bool parse_int(const std::string &s, int64_t &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

inline bool parse_double(const std::string &s, double &out) {
    if (s.empty()) return false;
    errno = 0;
    char *end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

} // namespace detail

/**
 * @brief YAML 节点
 */
class Node {
public:
    NodeValue value;

    Node() : value(std::monostate{}) {}
    explicit Node(const std::string &s) : value(s) {}
    explicit Node(int64_t i) : value(i) {}
    explicit Node(double d) : value(d) {}
    explicit Node(bool b) : value(b) {}
    explicit Node(const NodeMap &m) : value(m) {}
    explicit Node(const NodeList &l) : value(l) {}

    bool is_null() const { return std::holds_alternative<std::monostate>(value); }
    bool is_string() const { return std::holds_alternative<std::string>(value); }
    bool is_int() const { return std::holds_alternative<int64_t>(value); }
    bool is_double() const { return std::holds_alternative<double>(value); }
    bool is_bool() const { return std::holds_alternative<bool>(value); }
    bool is_map() const { return std::holds_alternative<NodeMap>(value); }
    bool is_list() const { return std::holds_alternative<NodeList>(value); }

    std::string as_string(const std::string &def = "") const {
        if (is_string()) return std::get<std::string>(value);
        if (is_int()) return std::to_string(std::get<int64_t>(value));
        if (is_double()) {
            std::ostringstream oss;
            oss << std::get<double>(value);
            return oss.str();
        }
        if (is_bool()) return std::get<bool>(value) ? "true" : "false";
        return def;
    }

    /**
     * @brief 读取整数；类型不符时返回错误而不是静默取默认值
     */
    Result<int64_t> as_int() const {
        if (is_int()) return std::get<int64_t>(value);
        int64_t v = 0;
        if (is_string() && detail::parse_int(std::get<std::string>(value), v)) {
            return v;
        }
        return Err<int64_t>(ErrorCode::CONFIG_INVALID_VALUE,
                            "expected integer, got '" + as_string() + "'");
    }

    Result<double> as_double() const {
        if (is_double()) return std::get<double>(value);
        if (is_int()) return static_cast<double>(std::get<int64_t>(value));
        double v = 0;
        if (is_string() && detail::parse_double(std::get<std::string>(value), v)) {
            return v;
        }
        return Err<double>(ErrorCode::CONFIG_INVALID_VALUE,
                           "expected number, got '" + as_string() + "'");
    }

    Result<bool> as_bool() const {
        if (is_bool()) return std::get<bool>(value);
        if (is_int()) return std::get<int64_t>(value) != 0;
        if (is_string()) {
            std::string s = detail::lower(std::get<std::string>(value));
            if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
            if (s == "false" || s == "no" || s == "off" || s == "0") return false;
        }
        return Err<bool>(ErrorCode::CONFIG_INVALID_VALUE,
                         "expected boolean, got '" + as_string() + "'");
    }

    const NodeMap& as_map() const {
        static const NodeMap empty;
        return is_map() ? std::get<NodeMap>(value) : empty;
    }

    NodePtr get(const std::string &key) const {
        if (!is_map()) return nullptr;
        const auto &m = std::get<NodeMap>(value);
        auto it = m.find(key);
        return it != m.end() ? it->second : nullptr;
    }

    /**
     * @brief 按点分路径取子节点，如 "queue.max_attempts"
     */
    NodePtr at_path(const std::string &path) const {
        size_t pos = path.find('.');
        if (pos == std::string::npos) {
            return get(path);
        }
        auto child = get(path.substr(0, pos));
        if (!child) return nullptr;
        return child->at_path(path.substr(pos + 1));
    }

    /**
     * @brief 按点分路径写入标量，中间节点不存在时创建
     */
    void set_path(const std::string &path, NodePtr leaf) {
        if (!is_map()) value = NodeMap{};
        auto &m = std::get<NodeMap>(value);
        size_t pos = path.find('.');
        if (pos == std::string::npos) {
            m[path] = std::move(leaf);
            return;
        }
        std::string head = path.substr(0, pos);
        auto &child = m[head];
        if (!child) child = std::make_shared<Node>(NodeMap{});
        child->set_path(path.substr(pos + 1), std::move(leaf));
    }
};

//==============================================================================
// YAML 解析器
//==============================================================================

class Parser {
private:
    std::vector<std::string> lines_;
    size_t current_line_ = 0;

    static size_t indent_of(const std::string &line) {
        size_t n = 0;
        for (char c : line) {
            if (c == ' ') n += 1;
            else if (c == '\t') n += 2;
            else break;
        }
        return n;
    }

    /**
     * @brief 在引号之外找第一个满足 hit(s, i) 的位置
     */
    template<typename Pred>
    static size_t scan_unquoted(const std::string &s, Pred hit) {
        char quote = 0;
        for (size_t i = 0; i < s.size(); i++) {
            char c = s[i];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (hit(s, i)) {
                return i;
            }
        }
        return std::string::npos;
    }

    static bool space_or_end(const std::string &s, size_t i) {
        return i >= s.size() || s[i] == ' ' || s[i] == '\t';
    }

    /// 去掉行尾注释：'#' 须在行首或空白之后
    static std::string strip_comment(const std::string &line) {
        size_t hash = scan_unquoted(line, [](const std::string &s, size_t i) {
            return s[i] == '#' && (i == 0 || space_or_end(s, i - 1));
        });
        return hash == std::string::npos ? line : line.substr(0, hash);
    }

    /// "key: value" 中的冒号；冒号后须为空白或行尾
    static size_t key_colon(const std::string &s) {
        return scan_unquoted(s, [](const std::string &t, size_t i) {
            return t[i] == ':' && space_or_end(t, i + 1);
        });
    }

    static bool quoted(const std::string &s) {
        return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
    }

    static std::string unquote(const std::string &s) {
        return quoted(s) ? s.substr(1, s.size() - 2) : s;
    }

public:
    static NodePtr parse_scalar(const std::string &raw) {
        std::string v = detail::trim(raw);
        if (v.empty() || v == "~" || v == "null") return std::make_shared<Node>();
        if (quoted(v)) return std::make_shared<Node>(unquote(v));

        std::string low = detail::lower(v);
        if (low == "true" || low == "yes") return std::make_shared<Node>(true);
        if (low == "false" || low == "no") return std::make_shared<Node>(false);

        int64_t i = 0;
        if (detail::parse_int(v, i)) return std::make_shared<Node>(i);
        double d = 0;
        if (v.find_first_of(".eE") != std::string::npos && detail::parse_double(v, d)) {
            return std::make_shared<Node>(d);
        }
        return std::make_shared<Node>(v);
    }

private:
    /// "[a, b]" / "{k: v}" 去掉括号后按引号外的逗号切分
    static std::vector<std::string> flow_items(const std::string &s) {
        std::vector<std::string> items;
        std::string rest = s.substr(1, s.size() - 2);
        while (true) {
            size_t comma = scan_unquoted(rest, [](const std::string &t, size_t i) { return t[i] == ','; });
            std::string item = detail::trim(rest.substr(0, comma));
            if (!item.empty()) items.push_back(item);
            if (comma == std::string::npos) break;
            rest = rest.substr(comma + 1);
        }
        return items;
    }

    static NodePtr parse_flow_list(const std::string &s) {
        NodeList list;
        for (const auto &item : flow_items(s)) list.push_back(parse_scalar(item));
        return std::make_shared<Node>(list);
    }

    static NodePtr parse_flow_map(const std::string &s) {
        NodeMap map;
        for (const auto &item : flow_items(s)) {
            size_t colon = key_colon(item);
            if (colon == std::string::npos) continue;
            map[unquote(detail::trim(item.substr(0, colon)))] = parse_scalar(item.substr(colon + 1));
        }
        return std::make_shared<Node>(map);
    }

    NodePtr parse_value(const std::string &s) {
        std::string value = detail::trim(s);
        if (value.empty()) {
            return std::make_shared<Node>();
        }
        if (value.front() == '[' && value.back() == ']') {
            return parse_flow_list(value);
        }
        if (value.front() == '{' && value.back() == '}') {
            return parse_flow_map(value);
        }
        return parse_scalar(value);
    }

    /**
     * @brief 下一行非空内容的缩进；没有更多内容返回 npos
     */
    size_t peek_indent() {
        for (size_t i = current_line_; i < lines_.size(); i++) {
            std::string line = strip_comment(lines_[i]);
            if (!detail::trim(line).empty()) return indent_of(line);
        }
        return std::string::npos;
    }

    /**
     * @brief 解析缩进为 base_indent 的块（map 或 list）
     */
    Result<NodePtr> parse_block(size_t base_indent) {
        NodeMap map;
        NodeList list;
        bool list_mode = false;
        bool map_mode = false;

        while (current_line_ < lines_.size()) {
            std::string line = strip_comment(lines_[current_line_]);
            std::string trimmed = detail::trim(line);

            if (trimmed.empty()) {
                current_line_++;
                continue;
            }

            size_t indent = indent_of(line);
            if (indent < base_indent) {
                break;
            }
            if (indent > base_indent) {
                return Err<NodePtr>(ErrorCode::CONFIG_PARSE_ERROR,
                                    "unexpected indentation at line " +
                                    std::to_string(current_line_ + 1));
            }

            if (trimmed[0] == '-' && (trimmed.size() == 1 || trimmed[1] == ' ')) {
                if (map_mode) {
                    return Err<NodePtr>(ErrorCode::CONFIG_PARSE_ERROR,
                                        "list item inside map at line " +
                                        std::to_string(current_line_ + 1));
                }
                list_mode = true;
                std::string item = detail::trim(trimmed.substr(1));
                current_line_++;
                if (item.empty()) {
                    size_t child = peek_indent();
                    if (child == std::string::npos || child <= indent) {
                        list.push_back(std::make_shared<Node>());
                    } else {
                        SCIV_TRY_UNWRAP(node, parse_block(child));
                        list.push_back(node);
                    }
                } else {
                    list.push_back(parse_value(item));
                }
                continue;
            }

            size_t colon = key_colon(trimmed);
            if (colon == std::string::npos || list_mode) {
                return Err<NodePtr>(ErrorCode::CONFIG_PARSE_ERROR,
                                    "expected 'key: value' at line " +
                                    std::to_string(current_line_ + 1));
            }
            map_mode = true;
            std::string key = unquote(detail::trim(trimmed.substr(0, colon)));
            std::string val = detail::trim(trimmed.substr(colon + 1));
            current_line_++;

            if (val.empty()) {
                size_t child = peek_indent();
                if (child == std::string::npos || child <= indent) {
                    map[key] = std::make_shared<Node>();
                } else {
                    SCIV_TRY_UNWRAP(node, parse_block(child));
                    map[key] = node;
                }
            } else {
                map[key] = parse_value(val);
            }
        }

        if (list_mode) {
            return std::make_shared<Node>(list);
        }
        return std::make_shared<Node>(map);
    }

public:
    Result<NodePtr> parse(const std::string &content) {
        lines_.clear();
        current_line_ = 0;

        std::istringstream iss(content);
        std::string line;
        while (std::getline(iss, line)) {
            lines_.push_back(line);
        }

        size_t first = peek_indent();
        if (first == std::string::npos) {
            return std::make_shared<Node>(NodeMap{});
        }
        return parse_block(first);
    }
};

//==============================================================================
// 便捷函数
//==============================================================================

inline Result<NodePtr> parse_yaml(const std::string &content) {
    Parser parser;
    return parser.parse(content);
}

inline Result<NodePtr> load_yaml(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Err<NodePtr>(ErrorCode::FILE_NOT_FOUND, "cannot open " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto node = parse_yaml(buffer.str());
    if (node.is_error()) {
        node.error().with_context(filename);
    }
    return node;
}

} // namespace yaml
} // namespace sciv

#endif // SCIV_CORE_YAML_CONFIG_H
