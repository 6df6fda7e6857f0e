#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

inline const json *step(const json *ref, const std::string &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}

}  // namespace detail_access

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = detail_access::step(ref, std::string(keys))), ...);
    return ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    return *ref;
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段不存在、为 null 或者类型不匹配时返回默认值
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

}  // namespace nlohmann
