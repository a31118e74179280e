#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_path {
template <typename Key>
const json *step(const json *ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}
}  // namespace detail_path

/**
 * @brief 沿着 keys 查找 json 子节点，找不到或为 null 时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, const Keys &... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = detail_path::step(ref, keys)), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename... Keys>
bool exists(const json &j, const Keys &... keys) {
    return find_path(j, keys...) != nullptr;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, const Keys &... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename T, typename... Keys>
T get_value(const json &j, const Keys &... keys) {
    const json *res = find_path(j, keys...);
    if (!res) throw build_invalid_argument(j, keys...);
    try {
        return res->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, const Keys &... keys) {
    const json *res = find_path(j, keys...);
    if (!res) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

/**
 * @brief 若 keys 对应的节点存在，则覆盖 value，否则保持默认值
 * @throw std::invalid_argument 节点存在但类型不匹配
 */
template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, const Keys &... keys) {
    const json *res = find_path(j, keys...);
    if (!res) return;
    try {
        value = res->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

}  // namespace nlohmann
