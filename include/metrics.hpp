#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <memory>
#include <string>

namespace grader::metrics {

/**
 * @brief 整个评测服务共用的 Prometheus 指标注册表
 */
std::shared_ptr<prometheus::Registry> global_registry();

/**
 * @brief 评测服务进程级别的指标，通过 HTTP 暴露给 Prometheus 抓取
 */
struct service_metrics {
    explicit service_metrics(const std::string &bind_address);

    /**
     * @brief 服务开始接受评测请求，记录 worker 数
     */
    void serving(int workers);

    /**
     * @brief 服务正在退出
     */
    void stopping();

private:
    prometheus::Exposer exposer;
    prometheus::Gauge &up;
    prometheus::Gauge &workers;
};

}  // namespace grader::metrics
