#pragma once

#include <filesystem>
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 在本机上运行命令的沙箱
 * 每个沙箱有一个私有的工作目录 RUN_DIR/<name>，命令在新的进程组中运行，
 * 并通过 setrlimit 限制栈大小和虚拟内存。
 * 由于命令和评分进程使用同一个用户运行，进程数限制不会生效，
 * 需要完整隔离时请使用 docker_sandbox。
 */
struct local_sandbox : public sandbox {
    explicit local_sandbox(const resource_limits &default_limits = default_resource_limits(),
                           const std::filesystem::path &root = RUN_DIR);
    ~local_sandbox();

    /**
     * @brief 沙箱的工作目录
     */
    std::filesystem::path working_directory() const;

protected:
    void do_start() override;
    void do_destroy() override;
    void do_add_files(const std::vector<std::filesystem::path> &files) override;
    command_result do_run_command(const command_request &request, const resource_limits &limits) override;

private:
    std::filesystem::path root;
};

}  // namespace grader
