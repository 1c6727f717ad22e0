#include "common/io_utils.hpp"

#include <fcntl.h>
#include <sys/file.h>

#include <algorithm>
#include <cerrno>
#include <fmt/core.h>
#include <fstream>
#include <system_error>

#include "common/exceptions.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path, long max_bytes) {
    ifstream fin(path.string(), ios::in | ios::binary | ios::ate);
    if (!fin)
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("unable to open file {}", path.string())));

    auto file_size = fin.tellg();
    fin.seekg(0, ios::beg);

    auto read_size = max_bytes > 0 ? min(file_size, ifstream::pos_type(max_bytes)) : file_size;

    string result;
    result.resize(read_size);
    fin.read(&result[0], read_size);

    if (read_size < file_size) result += TRUNCATED_MARK;
    return result;
}

string read_file_content(const fs::path &path, const string &def, long max_bytes) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path, max_bytes);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::out | ios::binary | ios::trunc);
    if (!fout)
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("unable to write file {}", path.string())));
    fout.write(content.data(), content.size());
    if (!fout)
        BOOST_THROW_EXCEPTION(internal_error(fmt::format("error when writing file {}", path.string())));
}

// 返回 s[i] 开始的合法 UTF-8 字符的字节数，不合法时返回 0
static size_t utf8_sequence_length(const string &s, size_t i) {
    unsigned char c = s[i];
    size_t n;
    unsigned char lo = 0x80, hi = 0xBF;
    if (c <= 0x7F) return 1;
    if (c >= 0xC2 && c <= 0xDF) n = 2;
    else if (c >= 0xE0 && c <= 0xEF) {
        n = 3;
        if (c == 0xE0) lo = 0xA0;
        if (c == 0xED) hi = 0x9F;  // UTF-16 代理区
    } else if (c >= 0xF0 && c <= 0xF4) {
        n = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else
        return 0;

    if (i + n > s.size()) return 0;
    for (size_t k = 1; k < n; k++) {
        unsigned char cc = s[i + k];
        if (k == 1 ? (cc < lo || cc > hi) : (cc & 0xC0) != 0x80) return 0;
    }
    return n;
}

string utf8_sanitize(const string &text) {
    string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        size_t n = utf8_sequence_length(text, i);
        if (n == 0) {
            result += "\xEF\xBF\xBD";
            ++i;
        } else {
            result.append(text, i, n);
            i += n;
        }
    }
    return result;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        BOOST_THROW_EXCEPTION(grader_exception(fmt::format("subpath is not safe {}", subpath)));
    return subpath;
}

string truncate_error_output(const string &text, size_t max_lines) {
    size_t lines = 1, pos = text.size();
    // 从后往前数 max_lines 个换行符
    while (pos > 0) {
        size_t found = text.rfind('\n', pos - 1);
        if (found == string::npos) return text;
        if (lines == max_lines) {
            return text.substr(found + 1) + "\n... Extra output Trimmed.";
        }
        ++lines;
        pos = found;
    }
    return text;
}

directory_lock::directory_lock(const fs::path &dir, bool shared) {
    fd.reset(open((dir / ".lock").c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644));
    if (!fd.is_open())
        BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "unable to open lock file in " + dir.string()));
    while (flock(fd.get(), shared ? LOCK_SH : LOCK_EX) == -1) {
        if (errno != EINTR)
            BOOST_THROW_EXCEPTION(system_error(errno, system_category(), "unable to lock " + dir.string()));
    }
}

}  // namespace grader
