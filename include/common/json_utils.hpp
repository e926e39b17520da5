#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <type_traits>
#include "common/exceptions.hpp"

namespace grader {

/**
 * @brief 拼接 JSON 节点路径，用于报错信息，如 judge.evaluation.states
 */
std::string json_route(const std::string &route, const std::string &key);

/**
 * @brief 断言 j 是一个对象，且键集合恰好为 keys
 * 缺少键、多出未知的键都会导致检查失败
 * @param route 节点在文档中的路径，用于报错
 * @throw schema_validation_error 检查失败
 */
void assert_exact_keys(const nlohmann::json &j, const std::string &route, const std::set<std::string> &keys);

/**
 * @brief 断言 j 是一个对象
 * @throw schema_validation_error j 不是对象
 */
void assert_object(const nlohmann::json &j, const std::string &route);

/**
 * @brief 读取对象 j 中键 key 对应的值并转换为 T
 * 与 nlohmann::json::at 不同的是，类型不匹配或缺少键时抛出 schema_validation_error。
 * 整数类型只接受 JSON 整数，不会截断小数
 */
template <typename T>
T get_value(const nlohmann::json &j, const std::string &route, const std::string &key) {
    if (!j.is_object() || !j.count(key))
        throw schema_validation_error("Missing key: " + json_route(route, key));
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!j.at(key).is_number_integer())
            throw schema_validation_error("Expected an integer at: " + json_route(route, key) + ", got " + j.at(key).dump());
    }
    try {
        return j.at(key).get<T>();
    } catch (nlohmann::json::exception &e) {
        throw schema_validation_error("Unexpected value type of: " + json_route(route, key) + ", " + e.what());
    }
}

}  // namespace grader
