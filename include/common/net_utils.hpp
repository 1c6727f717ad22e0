#pragma once

#include <string>

#include "common/json_utils.hpp"

namespace grader::net {

/**
 * @brief 将评测报告等 JSON 数据 POST 到指定地址
 * 网络错误和 5xx 响应会重试，4xx 响应不会重试
 * @param timeout 单次请求的超时时间（单位为秒）
 * @param attempts 最多请求的次数
 * @return 响应内容
 * @throw network_error 所有请求都失败
 */
std::string post_json(const std::string &url, const nlohmann::json &body, double timeout = 1.0, int attempts = 3);

}  // namespace grader::net
