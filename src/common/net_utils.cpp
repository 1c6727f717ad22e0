#include "common/net_utils.hpp"

#include <cpr/cpr.h>
#include <fmt/core.h>

#include <chrono>
#include <thread>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace grader::net {
using namespace std;

string post_json(const string &url, const nlohmann::json &body, double timeout, int attempts) {
    string payload = body.dump();
    string failure;
    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (attempt > 1) this_thread::sleep_for(chrono::milliseconds(500 * (attempt - 1)));

        auto resp = cpr::Post(cpr::Url{url},
                              cpr::Body{payload},
                              cpr::Header{{"Content-Type", "application/json; charset=utf-8"}},
                              cpr::Timeout{static_cast<int>(timeout * 1000)});
        if (resp.status_code >= 200 && resp.status_code < 400) return resp.text;

        if (resp.status_code == 0)
            failure = resp.error.message;
        else
            failure = fmt::format("HTTP {}", resp.status_code);

        if (resp.status_code >= 400 && resp.status_code < 500) break;
        LOG_WARN << "POST " << url << " failed (" << attempt << "/" << attempts << "): " << failure;
    }
    BOOST_THROW_EXCEPTION(network_error(fmt::format("Unable to post to {}: {}", url, failure)));
}

}  // namespace grader::net
