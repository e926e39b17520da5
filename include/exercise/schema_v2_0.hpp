#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "exercise/definition.hpp"

namespace grader::schema_v2_0 {

extern const std::string VERSION;

/**
 * @brief 解析 v2.0 格式的 setting.json
 * 每个对象节点的键集合必须完全一致，不允许缺少或多出键
 * @throw schema_validation_error 配置文档不合法
 */
exercise_definition load(const nlohmann::json &setting);

}  // namespace grader::schema_v2_0
