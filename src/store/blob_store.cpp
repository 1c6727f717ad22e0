#include "store/blob_store.hpp"

#include <fmt/core.h>
#include <unistd.h>

#include <cctype>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "logging.hpp"

namespace grader::store {
using namespace std;
namespace fs = std::filesystem;

blob_store::~blob_store() {}

static string escape_key_part(const string &part) {
    string escaped;
    for (char c : part) {
        if (c == '%')
            escaped += "%25";
        else if (c == '/')
            escaped += "%2F";
        else
            escaped += c;
    }
    return escaped;
}

string make_key(const string &prefix, const string &context, const string &user) {
    return prefix + "/" + escape_key_part(context) + "/" + escape_key_part(user);
}

file_blob_store::file_blob_store(const fs::path &root) : root(root) {
    fs::create_directories(root);
}

fs::path file_blob_store::path_of(const string &key) const {
    string name;
    for (unsigned char c : key) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.')
            name += c;
        else
            name += fmt::format("%{:02X}", c);
    }
    // . 和 .. 不能作为文件名
    if (name == "." || name == "..") name = fmt::format("%2E{}", name.substr(1));
    return root / (name + ".json");
}

void file_blob_store::persist(const string &key, const string &value) {
    directory_lock lock(root, false);
    fs::path path = path_of(key);
    fs::path temp = path;
    temp += fmt::format(".{}.tmp", getpid());
    write_file_content(temp, value);
    fs::rename(temp, path);
}

optional<string> file_blob_store::read(const string &key) const {
    directory_lock lock(root, true);
    fs::path path = path_of(key);
    if (!fs::exists(path)) return nullopt;
    return read_file_content(path);
}

void file_blob_store::remove(const string &key) {
    directory_lock lock(root, false);
    fs::remove(path_of(key));
}

void memory_blob_store::persist(const string &key, const string &value) {
    scoped_lock guard(mut);
    data[key] = value;
}

optional<string> memory_blob_store::read(const string &key) const {
    scoped_lock guard(mut);
    auto it = data.find(key);
    if (it == data.end()) return nullopt;
    return it->second;
}

void memory_blob_store::remove(const string &key) {
    scoped_lock guard(mut);
    data.erase(key);
}

}  // namespace grader::store
