#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "exercise/definition.hpp"

namespace grader {

/**
 * @brief 一个版本的题目配置格式
 */
struct schema_entry {
    /**
     * @brief 版本号，与 setting.json 的 schema_version 精确匹配
     */
    std::string version;

    /**
     * @brief 检查并转换配置文档
     * @throw schema_validation_error 配置文档不合法
     */
    std::function<exercise_definition(const nlohmann::json &)> load;
};

/**
 * @brief 配置格式版本表
 * 只允许追加，最后注册的版本为最新版本
 */
struct schema_registry {
    /**
     * @brief 注册新的版本
     * @throw std::invalid_argument 版本已存在
     */
    void register_schema(schema_entry entry);

    /**
     * @brief 按版本号精确查找
     * @return 找不到时返回 nullptr
     */
    const schema_entry *find(const std::string &version) const;

    /**
     * @brief 最新版本，即最后注册的版本
     * @return 没有注册任何版本时返回 nullptr
     */
    const schema_entry *latest() const;

    const std::vector<schema_entry> &entries() const;

private:
    std::vector<schema_entry> schemas;
};

/**
 * @brief 包含所有内置版本的配置格式版本表
 */
const schema_registry &default_schema_registry();

}  // namespace grader
