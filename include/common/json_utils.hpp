#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg.pop_back();
    return std::invalid_argument(msg);
}

template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null())
        throw build_invalid_argument(keys...);
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

/**
 * @brief 读取可选的配置项
 * @param def_value 如果配置项不存在或为 null，返回该值
 * @throw std::invalid_argument 如果配置项存在但类型不对
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref || ref->is_null()) return def_value;
    try {
        return ref->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(keys...);
    }
}

}  // namespace nlohmann
