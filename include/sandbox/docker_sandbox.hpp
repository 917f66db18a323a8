#pragma once

#include <string>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在 docker 容器中运行命令的沙箱
 * 启动时创建一个没有网络的容器，命令通过 docker exec 以 SANDBOX_USER 用户运行，
 * 资源限制通过容器内的 prlimit 设置。
 * 命令超时后，沙箱会杀死容器中该用户的所有进程。
 */
struct docker_sandbox : public sandbox {
    explicit docker_sandbox(const std::string &image = SANDBOX_IMAGE,
                            const resource_limits &default_limits = default_resource_limits());
    ~docker_sandbox();

    const std::string &image() const;

    /**
     * @brief 生成在容器中执行命令的 docker exec 命令行
     */
    std::vector<std::string> exec_command(const std::vector<std::string> &argv, const resource_limits &limits, bool interactive) const;

protected:
    void do_start() override;
    void do_destroy() override;
    void do_add_files(const std::vector<std::filesystem::path> &files) override;
    command_result do_run_command(const command_request &request, const resource_limits &limits) override;

private:
    std::string image_name;
};

}  // namespace grader
