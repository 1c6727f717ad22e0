#include "metrics.hpp"

#include "logging.hpp"

namespace grader::metrics {
using namespace std;

shared_ptr<prometheus::Registry> global_registry() {
    static shared_ptr<prometheus::Registry> registry = make_shared<prometheus::Registry>();
    return registry;
}

service_metrics::service_metrics(const string &bind_address)
    : exposer(bind_address, 2),
      up(prometheus::BuildGauge()
             .Name("code_grader_up")
             .Help("Whether the code grader is accepting grading requests")
             .Register(*global_registry())
             .Add({})),
      workers(prometheus::BuildGauge()
                  .Name("code_grader_workers")
                  .Help("How many grading workers are running")
                  .Register(*global_registry())
                  .Add({})) {
    exposer.RegisterCollectable(global_registry());
    LOG_INFO << "Exposing metrics on " << bind_address;
}

void service_metrics::serving(int worker_count) {
    workers.Set(worker_count);
    up.Set(1);
}

void service_metrics::stopping() {
    up.Set(0);
}

}  // namespace grader::metrics
