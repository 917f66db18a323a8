#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace grader {

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

    /**
     * @brief 完整的诊断信息，包括异常信息和抛出异常时的调用栈
     * 用于写入构建任务的 internal_error_msg
     */
    std::string diagnostic() const;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评分系统的内部错误
 * 一般是系统自身或者调用的外部程序出现了非预期的问题
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示数据库查询错误
 * 这类错误通常是暂时性的（死锁、连接断开），调用方应当通过 retry_on_transient 重试
 */
struct database_error : public grader_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示测试配置错误，比如引用了不存在的项目文件
 * 这类错误不会重试，直接报告给调用方
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示一个必须成功执行的外部命令返回了非零值
 * 保存了命令参数、返回值和命令的输出
 */
struct command_error : public grader_exception {
    command_error(const std::vector<std::string> &argv, int exit_code, const std::string &output);

    const std::vector<std::string> &command() const noexcept;
    int exit_code() const noexcept;
    const std::string &output() const noexcept;

private:
    std::vector<std::string> argv;
    int code;
    std::string command_output;
};

/**
 * @brief 生成任意异常的诊断信息，用于记录内部错误
 * 对 grader_exception 会附带调用栈，对 command_error 会附带命令输出
 */
std::string describe_exception(const std::exception &ex);

}  // namespace grader
