/**
 * @file environment.h
 * @brief 容器环境变量清洗
 */

#ifndef SCIV_SANDBOX_ENVIRONMENT_H
#define SCIV_SANDBOX_ENVIRONMENT_H

#include <string>
#include <vector>
#include <set>
#include <map>

namespace sciv {
namespace sandbox {

/// 容器内固定的 PATH
constexpr const char* CONTAINER_PATH = "/usr/local/bin:/usr/bin:/bin";

/**
 * @brief 禁止从运行器传入的环境变量
 *
 * 这些变量能改变解释器或动态链接器的加载行为。
 */
inline const std::set<std::string>& blocked_env_vars() {
    static const std::set<std::string> blocked = {
        "LD_PRELOAD", "LD_LIBRARY_PATH",
        "PYTHONSTARTUP", "PYTHONPATH", "PYTHONINSPECT", "PYTHONBREAKPOINT",
        "RUBYOPT", "PERL5OPT", "NODE_OPTIONS", "JAVA_TOOL_OPTIONS",
        "R_PROFILE", "R_PROFILE_USER", "R_ENVIRON", "R_ENVIRON_USER",
        "JULIA_LOAD_PATH", "JULIA_DEPOT_PATH",
        "BASH_ENV", "ENV", "CDPATH", "GLOBIGNORE",
        "PATH", "HOME",
    };
    return blocked;
}

/**
 * @brief 去掉黑名单变量与非法名字，再强制写入 PATH / HOME / LANG
 */
inline std::map<std::string, std::string> sanitize_env(const std::map<std::string, std::string> &env) {
    std::map<std::string, std::string> clean;
    const auto &blocked = blocked_env_vars();
    for (const auto &kv : env) {
        if (kv.first.empty() || kv.first.find('=') != std::string::npos ||
            kv.first.find('\0') != std::string::npos || kv.second.find('\0') != std::string::npos) {
            continue;
        }
        if (blocked.count(kv.first) || kv.first.compare(0, 3, "LD_") == 0) {
            continue;
        }
        clean[kv.first] = kv.second;
    }
    clean["PATH"] = CONTAINER_PATH;
    clean["HOME"] = "/tmp";
    clean["LANG"] = "C.UTF-8";
    return clean;
}

/**
 * @brief 转成 execve 需要的 "KEY=VALUE" 列表
 */
inline std::vector<std::string> env_to_strings(const std::map<std::string, std::string> &env) {
    std::vector<std::string> out;
    out.reserve(env.size());
    for (const auto &kv : env) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

} // namespace sandbox
} // namespace sciv

#endif // SCIV_SANDBOX_ENVIRONMENT_H
