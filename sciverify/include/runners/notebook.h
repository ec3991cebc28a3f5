/**
 * @file notebook.h
 * @brief 从 Jupyter / R Markdown 中抽取可执行代码
 */

#ifndef SCIV_RUNNERS_NOTEBOOK_H
#define SCIV_RUNNERS_NOTEBOOK_H

#include <string>
#include <sstream>

#include <json/json.h>

#include "core/error.h"
#include "core/json_codec.h"

namespace sciv {
namespace runners {

namespace detail {

inline std::string cell_source(const Json::Value &src) {
    if (src.isString()) return src.asString();
    std::string out;
    if (src.isArray()) {
        for (const auto &line : src) {
            if (line.isString()) out += line.asString();
        }
    }
    return out;
}

/**
 * @brief 把 IPython 魔法命令（%）与 shell 转义（!）注释掉
 */
inline std::string comment_magics(const std::string &code) {
    std::istringstream iss(code);
    std::ostringstream oss;
    std::string line;
    bool first = true;
    while (std::getline(iss, line)) {
        if (!first) oss << "\n";
        first = false;
        size_t p = line.find_first_not_of(" \t");
        if (p != std::string::npos && (line[p] == '%' || line[p] == '!')) {
            oss << "# " << line;
        } else {
            oss << line;
        }
    }
    return oss.str();
}

inline std::string trim_copy(const std::string &s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

} // namespace detail

/**
 * @brief 按顺序拼接 .ipynb 的 code cell
 */
inline Result<std::string> extract_ipynb(const std::string &notebook) {
    SCIV_TRY_UNWRAP(root, json::parse(notebook, ErrorCode::MALFORMED_NOTEBOOK));
    if (!root.isObject() || !root["cells"].isArray()) {
        return SCIV_ERROR(ErrorCode::MALFORMED_NOTEBOOK, "notebook has no cells array");
    }

    std::string code;
    int cells = 0;
    for (const auto &cell : root["cells"]) {
        if (!cell.isObject() || cell.get("cell_type", "").asString() != "code") continue;
        std::string src = detail::comment_magics(detail::cell_source(cell["source"]));
        if (cells > 0) code += "\n\n";
        code += src;
        cells++;
    }
    if (cells == 0) {
        return SCIV_ERROR(ErrorCode::MALFORMED_NOTEBOOK, "notebook has no code cells");
    }
    return code + "\n";
}

/**
 * @brief 拼接 R Markdown 中 ```{r ...} 围起来的代码块
 */
inline Result<std::string> extract_rmarkdown(const std::string &document) {
    std::istringstream iss(document);
    std::string line;
    std::string code;
    bool in_chunk = false;
    int chunks = 0;

    while (std::getline(iss, line)) {
        std::string t = detail::trim_copy(line);
        if (!in_chunk) {
            if (t.compare(0, 4, "```{") == 0 && t.size() > 5 &&
                (t[4] == 'r' || t[4] == 'R') &&
                (t[5] == '}' || t[5] == ' ' || t[5] == ',')) {
                in_chunk = true;
                if (chunks > 0) code += "\n";
                chunks++;
            }
        } else if (t == "```") {
            in_chunk = false;
        } else {
            code += line + "\n";
        }
    }
    if (in_chunk) {
        return SCIV_ERROR(ErrorCode::MALFORMED_NOTEBOOK, "unterminated R chunk");
    }
    if (chunks == 0) {
        return SCIV_ERROR(ErrorCode::MALFORMED_NOTEBOOK, "document has no R chunks");
    }
    return code;
}

} // namespace runners
} // namespace sciv

#endif // SCIV_RUNNERS_NOTEBOOK_H
