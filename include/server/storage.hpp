#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "exercise/identity.hpp"

namespace grader::server {

/**
 * @brief 数据目录的文件组织
 * data_dir/
 *     exercise_concretes/<agency>/<department>/<name>/<version>/<hash>/raw/   题目定义（setting.json 及脚本）
 *     submissions/<submission_id>/<file>                                      提交文件（只写一次）
 *     evaluation_results/<submission_id>/result.json                          评测结果
 *     evaluation_results/<submission_id>/delivery_failed                      回调失败标记
 *     evaluation_results/<submission_id>/<job_id>/                            评测工作目录
 * 所有路径分量都会检查，防止目录遍历
 */
struct storage {
    explicit storage(std::filesystem::path data_dir);

    /**
     * @brief 题目定义的根目录（raw 的上一级），上传时加锁用
     */
    std::filesystem::path exercise_base_dir(const exercise_identity &identity) const;

    /**
     * @brief 题目定义文件夹，包含 setting.json
     */
    std::filesystem::path exercise_dir(const exercise_identity &identity) const;

    std::filesystem::path submission_dir(const std::string &submission_id) const;

    std::filesystem::path evaluation_dir(const std::string &submission_id) const;

    std::filesystem::path working_dir(const std::string &submission_id, const std::string &job_id) const;

    std::filesystem::path result_file(const std::string &submission_id) const;

    std::filesystem::path delivery_failed_file(const std::string &submission_id) const;

    /**
     * @brief 原子地保存评测结果，覆盖之前的结果
     * 同时清除之前的回调失败标记
     */
    void save_result(const std::string &submission_id, const std::string &payload) const;

    /**
     * @brief 读取评测结果
     * @return 不存在时返回 std::nullopt
     */
    std::optional<std::string> load_result(const std::string &submission_id) const;

    /**
     * @brief 标记评测结果回调失败，等待人工处理
     */
    void mark_delivery_failed(const std::string &submission_id, const std::string &reason) const;

    bool is_delivery_failed(const std::string &submission_id) const;

private:
    std::filesystem::path data_dir;
};

}  // namespace grader::server
