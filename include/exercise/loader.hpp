#pragma once

#include <filesystem>
#include <string>
#include "exercise/definition.hpp"
#include "exercise/schema.hpp"

namespace grader {

/**
 * @brief 题目定义文件夹中的配置文件名
 */
extern const std::string SETTING_FILE_NAME;

struct loaded_exercise {
    exercise_definition definition;

    /**
     * @brief 配置文档声明的格式版本
     */
    std::string schema_version;
};

/**
 * @brief 加载题目定义
 * 读取 dir/setting.json，根据 schema_version 选择对应版本的解析器。
 * 只做解析和检查，不修改文件系统。
 * @param dir 题目定义文件夹
 * @param registry 配置格式版本表
 * @throw schema_validation_error 文件夹或配置文件不存在、格式不合法、版本未知
 */
loaded_exercise load_exercise(const std::filesystem::path &dir, const schema_registry &registry = default_schema_registry());

/**
 * @brief 检查 script 类型的动作和 required_files 引用的文件是否都在题目定义文件夹中
 * @return 缺失文件的列表
 */
std::vector<std::string> find_missing_files(const exercise_definition &def, const std::filesystem::path &dir);

}  // namespace grader
