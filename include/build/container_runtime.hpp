#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "process/process.hpp"

namespace grader {

/**
 * @brief 构建、检查、发布镜像的容器运行时
 */
struct container_runtime {
    virtual ~container_runtime();

    /**
     * @brief 启动镜像构建
     * 构建的资源限制（内存、进程数、CPU 配额）是平台固定的，不能由用户修改。
     * @param build_dir 构建上下文目录
     * @param tag 构建出来的镜像的 tag
     * @param output_file 构建程序的 stdout 和 stderr 都写入这个文件
     * @return 正在运行的构建程序
     * @throw std::system_error 如果构建程序无法启动
     */
    virtual std::unique_ptr<subprocess> spawn_build(const std::filesystem::path &build_dir,
                                                    const std::string &tag,
                                                    const std::filesystem::path &output_file) = 0;

    /**
     * @brief 读取镜像的运行配置（docker inspect 中的 .Config）
     * @throw command_error 如果命令失败
     */
    virtual nlohmann::json inspect_config(const std::string &tag) = 0;

    /**
     * @brief 将镜像推送到镜像仓库
     * @throw command_error 如果命令失败
     */
    virtual void push(const std::string &tag) = 0;
};

/**
 * @brief 通过 docker 命令行实现的容器运行时
 */
struct docker_runtime : public container_runtime {
    explicit docker_runtime(std::string docker = DOCKER);

    std::unique_ptr<subprocess> spawn_build(const std::filesystem::path &build_dir,
                                            const std::string &tag,
                                            const std::filesystem::path &output_file) override;
    nlohmann::json inspect_config(const std::string &tag) override;
    void push(const std::string &tag) override;

    /**
     * @brief 构建镜像的完整命令
     */
    std::vector<std::string> build_command(const std::filesystem::path &build_dir, const std::string &tag) const;

private:
    std::string docker;
};

}  // namespace grader
