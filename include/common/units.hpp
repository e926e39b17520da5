#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 将时间限制统一为微秒
 * 整数表示秒数，字符串为整数加后缀 m, s, ms, us（无后缀表示秒）
 * @param value 配置中的原始值
 * @param route 配置节点路径，用于报错
 * @throw schema_validation_error 格式不正确
 */
int64_t parse_time_limit(const nlohmann::json &value, const std::string &route);

/**
 * @brief 将内存限制统一为字节
 * 整数表示字节数，字符串为整数加后缀 GiB, MiB, KiB, GB, MB, KB（无后缀表示字节）
 * @throw schema_validation_error 格式不正确
 */
int64_t parse_memory_limit(const nlohmann::json &value, const std::string &route);

}  // namespace grader
