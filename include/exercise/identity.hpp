#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace grader {

/**
 * @brief 唯一标识一个题目定义
 * 同一题目的同一版本可能上传多次，以内容哈希区分
 */
struct exercise_identity {
    std::string agency;
    std::string department;
    std::string name;
    std::string version;

    /**
     * @brief 题目定义文件夹的内容哈希
     */
    std::string directory_hash;

    /**
     * @brief 检查每个字段都可以安全地作为一级路径名
     * @throw std::runtime_error 存在不安全的字段
     */
    void assert_safe() const;

    std::string to_string() const;
};

void to_json(nlohmann::json &j, const exercise_identity &identity);
void from_json(const nlohmann::json &j, exercise_identity &identity);

}  // namespace grader
