#include "store/result_store.hpp"

#include "logging.hpp"

namespace grader::store {
using namespace std;
using namespace nlohmann;

result_store::result_store(blob_store &blobs) : blobs(blobs) {}

string result_store::key_of(const string &context, const string &user) {
    return make_key("results", context, user);
}

void result_store::put(const string &context, const string &user, const judge::grade_report &report) {
    json j = report;
    blobs.persist(key_of(context, user), j.dump());
}

optional<judge::grade_report> result_store::get(const string &context, const string &user) const {
    auto data = blobs.read(key_of(context, user));
    if (!data) return nullopt;
    try {
        return json::parse(*data).get<judge::grade_report>();
    } catch (json::exception &e) {
        LOG_ERROR << "Stored report of " << context << "/" << user << " is malformed: " << e.what();
        return nullopt;
    }
}

void result_store::clear(const string &context, const string &user) {
    blobs.remove(key_of(context, user));
}

}  // namespace grader::store
