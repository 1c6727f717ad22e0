#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 判断 json 对象中是否存在非 null 的字段
 */
inline bool exists(const json &j, const std::string &key) {
    return j.find(key) != j.end() && !j.at(key).is_null();
}

/**
 * @brief 若字段存在，则赋值给 value，否则保持 value 不变
 */
template <typename T>
void assign_optional(const json &j, T &value, const std::string &key) {
    if (exists(j, key)) j.at(key).get_to(value);
}

template <typename T>
void assign_optional(const json &j, std::optional<T> &value, const std::string &key) {
    if (exists(j, key))
        value = j.at(key).get<T>();
    else
        value.reset();
}

/**
 * @brief 获取字段值，若字段不存在返回默认值
 */
template <typename T>
T get_value(const json &j, const std::string &key, const T &def) {
    return exists(j, key) ? j.at(key).get<T>() : def;
}

}  // namespace nlohmann
