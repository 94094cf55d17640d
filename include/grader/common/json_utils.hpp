#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace nlohmann {

namespace detail_grader {

inline const json *step(const json *ref, const std::string &key) {
    if (ref && ref->is_object() && ref->count(key)) return &ref->at(key);
    return nullptr;
}

template <typename... Keys>
const json *locate(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail_grader

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_grader::locate(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = detail_grader::locate(j, keys...);
    return !ref ? json{} : *ref;
}

}  // namespace nlohmann
