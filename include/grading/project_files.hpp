#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 项目文件的存储，用于读取期望输出和 stdin 的项目文件
 */
struct project_file_store {
    virtual ~project_file_store();

    /**
     * @brief 读取项目文件的内容
     * @throw configuration_error 如果项目文件不存在或者无法读取
     */
    virtual std::string read(const std::string &name) const = 0;
};

/**
 * @brief 保存在本地文件夹中的项目文件
 */
struct directory_project_file_store : public project_file_store {
    explicit directory_project_file_store(const std::filesystem::path &directory);

    std::string read(const std::string &name) const override;

    const std::filesystem::path &directory() const;

private:
    std::filesystem::path dir;
};

}  // namespace grader
