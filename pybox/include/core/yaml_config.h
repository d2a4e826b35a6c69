/**
 * @file yaml_config.h
 * @brief 配置文件使用的 YAML 子集解析器
 *
 * 支持：
 * - 块式 map / list，list 项内联 map（"- key: value"）
 * - 流式 [a, b] 与 {k: v}（不嵌套）
 * - 单引号、双引号字符串（引号内的 ':' ',' '#' 不做特殊处理）
 * - '#' 注释
 *
 * 语法错误返回 CONFIG_PARSE_ERROR，消息里带行号。
 */

#ifndef PYBOX_CORE_YAML_CONFIG_H
#define PYBOX_CORE_YAML_CONFIG_H

#include "error.h"

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace pybox {
namespace yaml {

class YamlNode;
using YamlNodePtr = std::shared_ptr<YamlNode>;

//==============================================================================
// 节点
//==============================================================================

/**
 * @brief YAML 节点
 *
 * 标量一律以文本保存，读取时再按需转换，这样配置层可以区分
 * "值不存在" 和 "值格式不对"。
 */
class YamlNode {
public:
    enum class Kind { NUL, SCALAR, MAP, LIST };

private:
    Kind kind_;
    std::string text_;
    bool quoted_ = false;
    std::map<std::string, YamlNodePtr> map_;
    std::vector<YamlNodePtr> list_;

public:
    explicit YamlNode(Kind kind = Kind::NUL) : kind_(kind) {}

    static YamlNodePtr scalar(const std::string &text, bool quoted) {
        auto node = std::make_shared<YamlNode>(Kind::SCALAR);
        node->text_ = text;
        node->quoted_ = quoted;
        return node;
    }

    Kind kind() const { return kind_; }
    bool is_null() const { return kind_ == Kind::NUL; }
    bool is_scalar() const { return kind_ == Kind::SCALAR; }
    bool is_map() const { return kind_ == Kind::MAP; }
    bool is_list() const { return kind_ == Kind::LIST; }
    bool quoted() const { return quoted_; }
    const std::string& text() const { return text_; }

    const std::map<std::string, YamlNodePtr>& entries() const { return map_; }
    const std::vector<YamlNodePtr>& items() const { return list_; }

    void set(const std::string &key, YamlNodePtr node) { map_[key] = std::move(node); }
    void append(YamlNodePtr node) { list_.push_back(std::move(node)); }

    /**
     * @brief 整数转换，非整数文本返回 false
     */
    bool to_int(int64_t &out) const {
        if (!is_scalar() || text_.empty()) return false;
        errno = 0;
        char *end = nullptr;
        long long v = std::strtoll(text_.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0') return false;
        out = static_cast<int64_t>(v);
        return true;
    }

    bool to_bool(bool &out) const {
        if (!is_scalar() || quoted_) return false;
        std::string s = text_;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "true" || s == "yes" || s == "on") { out = true; return true; }
        if (s == "false" || s == "no" || s == "off") { out = false; return true; }
        return false;
    }

    std::string as_string(const std::string &def = "") const {
        return is_scalar() ? text_ : def;
    }

    std::vector<std::string> as_string_list() const {
        std::vector<std::string> out;
        if (is_list()) {
            for (const auto &item : list_) {
                if (item->is_scalar()) out.push_back(item->text());
            }
        } else if (is_scalar()) {
            out.push_back(text_);
        }
        return out;
    }

    YamlNodePtr get(const std::string &key) const {
        if (!is_map()) return nullptr;
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : it->second;
    }

    /**
     * @brief 按点分路径查找，如 "execution.code.timeout_ms"
     */
    YamlNodePtr at(const std::string &path) const {
        size_t dot = path.find('.');
        if (dot == std::string::npos) return get(path);
        auto child = get(path.substr(0, dot));
        return child ? child->at(path.substr(dot + 1)) : nullptr;
    }

    bool has(const std::string &key) const { return get(key) != nullptr; }
};

//==============================================================================
// 解析器
//==============================================================================

class YamlParser {
private:
    struct Line {
        int number;
        size_t indent;
        std::string text;
    };

    std::vector<Line> lines_;
    size_t pos_ = 0;

    static std::string trim(const std::string &s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    static Error syntax_error(int line, const std::string &what) {
        return Error(ErrorCode::CONFIG_PARSE_ERROR,
                     "line " + std::to_string(line) + ": " + what);
    }

    // 去掉引号外、行首或空白之后的 '#' 注释
    static std::string strip_comment(const std::string &line) {
        char quote = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (quote) {
                if (c == '\\' && quote == '"') { ++i; continue; }
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
                return line.substr(0, i);
            }
        }
        return line;
    }

    /**
     * @brief 找到引号外第一个 "key: value" 分隔冒号
     */
    static size_t find_key_colon(const std::string &s) {
        char quote = 0;
        int depth = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) {
                if (c == '\\' && quote == '"') { ++i; continue; }
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '[' || c == '{') {
                ++depth;
            } else if (c == ']' || c == '}') {
                --depth;
            } else if (c == ':' && depth == 0 &&
                       (i + 1 == s.size() || s[i + 1] == ' ')) {
                return i;
            }
        }
        return std::string::npos;
    }

    static Result<YamlNodePtr> parse_scalar(const std::string &raw, int line) {
        std::string s = trim(raw);
        if (s.empty() || s == "~" || s == "null") {
            return std::make_shared<YamlNode>(YamlNode::Kind::NUL);
        }
        char q = s.front();
        if (q != '"' && q != '\'') {
            return YamlNode::scalar(s, false);
        }
        if (s.size() < 2 || s.back() != q) {
            return syntax_error(line, "unterminated quoted string");
        }
        std::string body = s.substr(1, s.size() - 2);
        std::string out;
        out.reserve(body.size());
        for (size_t i = 0; i < body.size(); ++i) {
            char c = body[i];
            if (q == '\'' && c == '\'' && i + 1 < body.size() && body[i + 1] == '\'') {
                out += '\'';
                ++i;
            } else if (q == '"' && c == '\\' && i + 1 < body.size()) {
                char n = body[++i];
                switch (n) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case '\\': out += '\\'; break;
                    case '"': out += '"'; break;
                    default: out += '\\'; out += n; break;
                }
            } else {
                out += c;
            }
        }
        return YamlNode::scalar(out, true);
    }

    // 在引号外按逗号切分
    static std::vector<std::string> split_flow(const std::string &s) {
        std::vector<std::string> parts;
        std::string cur;
        char quote = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) {
                if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                    cur += c;
                    cur += s[++i];
                    continue;
                }
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == ',') {
                parts.push_back(trim(cur));
                cur.clear();
                continue;
            }
            cur += c;
        }
        if (!trim(cur).empty()) parts.push_back(trim(cur));
        return parts;
    }

    static Result<YamlNodePtr> parse_inline(const std::string &raw, int line) {
        std::string s = trim(raw);
        if (s.empty()) return std::make_shared<YamlNode>(YamlNode::Kind::NUL);

        if (s.front() == '[' || s.front() == '{') {
            char close = s.front() == '[' ? ']' : '}';
            if (s.back() != close) {
                return syntax_error(line, "unterminated flow collection");
            }
            std::string body = s.substr(1, s.size() - 2);
            if (body.find_first_of("[]{}") != std::string::npos) {
                return syntax_error(line, "nested flow collections are not supported");
            }
            bool is_list = s.front() == '[';
            auto node = std::make_shared<YamlNode>(is_list ? YamlNode::Kind::LIST
                                                           : YamlNode::Kind::MAP);
            for (const auto &part : split_flow(body)) {
                if (is_list) {
                    auto item = parse_scalar(part, line);
                    if (!item.ok()) return item.error();
                    node->append(item.value());
                } else {
                    size_t colon = find_key_colon(part);
                    if (colon == std::string::npos) {
                        return syntax_error(line, "expected 'key: value' in flow map");
                    }
                    auto key = parse_scalar(part.substr(0, colon), line);
                    auto val = parse_scalar(part.substr(colon + 1), line);
                    if (!key.ok()) return key.error();
                    if (!val.ok()) return val.error();
                    node->set(key.value()->text(), val.value());
                }
            }
            return node;
        }
        return parse_scalar(s, line);
    }

    static bool is_list_item(const std::string &text) {
        return text == "-" || (text.size() >= 2 && text[0] == '-' && text[1] == ' ');
    }

    /**
     * @brief "key:" 之后的值：同一行的内联值，或下一行开始的子块
     */
    Result<YamlNodePtr> parse_child(const std::string &rest, size_t indent, int line,
                                    bool after_key) {
        if (!trim(rest).empty()) {
            return parse_inline(rest, line);
        }
        if (pos_ < lines_.size()) {
            const Line &next = lines_[pos_];
            // 允许 "key:" 下与 key 同列的列表
            if (next.indent > indent ||
                (after_key && next.indent == indent && is_list_item(next.text))) {
                return parse_block(next.indent);
            }
        }
        return std::make_shared<YamlNode>(YamlNode::Kind::NUL);
    }

    Result<YamlNodePtr> parse_block(size_t indent) {
        bool as_list = is_list_item(lines_[pos_].text);
        auto node = std::make_shared<YamlNode>(as_list ? YamlNode::Kind::LIST
                                                       : YamlNode::Kind::MAP);

        while (pos_ < lines_.size()) {
            Line &cur = lines_[pos_];
            if (cur.indent < indent) break;
            if (cur.indent > indent) {
                return syntax_error(cur.number, "unexpected indentation");
            }
            if (is_list_item(cur.text) != as_list) {
                // "key:" 下的同列列表在遇到下一个 key 时结束
                break;
            }

            if (as_list) {
                std::string rest = cur.text == "-" ? "" : trim(cur.text.substr(2));
                size_t colon = rest.empty() ? std::string::npos : find_key_colon(rest);
                bool inline_map = colon != std::string::npos &&
                                  rest.front() != '"' && rest.front() != '\'' &&
                                  rest.front() != '[' && rest.front() != '{';
                if (inline_map) {
                    // "- key: v" 视为缩进到内容列的一行，再按 map 解析
                    size_t shift = cur.text.find(rest);
                    cur.indent += shift;
                    cur.text = rest;
                    auto item = parse_block(cur.indent);
                    if (!item.ok()) return item;
                    node->append(item.value());
                } else {
                    int number = cur.number;
                    ++pos_;
                    auto item = parse_child(rest, indent, number, false);
                    if (!item.ok()) return item;
                    node->append(item.value());
                }
            } else {
                size_t colon = find_key_colon(cur.text);
                if (colon == std::string::npos) {
                    return syntax_error(cur.number, "expected 'key: value'");
                }
                auto key = parse_scalar(cur.text.substr(0, colon), cur.number);
                if (!key.ok()) return key;
                std::string rest = cur.text.substr(colon + 1);
                int number = cur.number;
                ++pos_;
                auto value = parse_child(rest, indent, number, true);
                if (!value.ok()) return value;
                node->set(key.value()->text(), value.value());
            }
        }
        return node;
    }

public:
    Result<YamlNodePtr> parse(const std::string &content) {
        lines_.clear();
        pos_ = 0;

        std::istringstream iss(content);
        std::string raw;
        int number = 0;
        while (std::getline(iss, raw)) {
            ++number;
            std::string text = strip_comment(raw);
            std::string trimmed = trim(text);
            if (trimmed.empty() || trimmed == "---") continue;

            size_t indent = text.find_first_not_of(' ');
            if (text[indent] == '\t') {
                return syntax_error(number, "tab character in indentation");
            }
            lines_.push_back({number, indent, trimmed});
        }

        if (lines_.empty()) {
            return std::make_shared<YamlNode>(YamlNode::Kind::MAP);
        }
        auto root = parse_block(lines_[0].indent);
        if (!root.ok()) return root;
        if (pos_ < lines_.size()) {
            return syntax_error(lines_[pos_].number, "unexpected indentation");
        }
        return root;
    }
};

inline Result<YamlNodePtr> parse_yaml(const std::string &content) {
    YamlParser parser;
    return parser.parse(content);
}

inline Result<YamlNodePtr> load_yaml(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error(ErrorCode::FILE_NOT_FOUND, "cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error(ErrorCode::FILE_READ_ERROR, "cannot read " + path);
    }
    auto parsed = parse_yaml(buffer.str());
    if (!parsed.ok()) {
        parsed.error().with_context(path);
    }
    return parsed;
}

} // namespace yaml
} // namespace pybox

#endif // PYBOX_CORE_YAML_CONFIG_H
