#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace grader {

/**
 * @brief 镜像构建任务的状态
 * queued -> in_progress -> {done, failed, image_invalid, internal_error, cancelled}
 * queued -> cancelled
 * 终止状态不会再改变。
 */
enum class build_status {
    queued,
    in_progress,
    done,
    failed,
    image_invalid,
    internal_error,
    cancelled
};

std::string status_name(build_status status);

/**
 * @throw std::invalid_argument 如果 str 不是合法的状态名
 */
build_status build_status_from_string(const std::string &str);

bool is_terminal(build_status status);

/**
 * @brief 状态机是否允许从 from 转换到 to
 */
bool can_transition(build_status from, build_status to);

/**
 * @brief 构建沙箱镜像的任务
 */
struct build_task {
    int id = 0;

    /**
     * @brief 镜像所属的课程
     */
    int course_id = 0;

    /**
     * @brief docker build 的上下文目录
     */
    std::filesystem::path build_dir;

    /**
     * @brief docker build 输出的保存文件
     */
    std::filesystem::path output_filename;

    build_status status = build_status::queued;

    /**
     * @brief docker build 的返回值，构建超时或者被取消时可能为空
     */
    std::optional<int> return_code;
    bool timed_out = false;

    std::string validation_error_msg;
    std::string internal_error_msg;

    /**
     * @brief 要更新的镜像，为空时构建成功后创建新的镜像
     */
    std::optional<int> image_id;
};

/**
 * @brief 构建出来的沙箱镜像
 */
struct sandbox_image {
    int id = 0;
    int course_id = 0;
    std::string display_name;
    std::string tag;
};

}  // namespace grader
