#pragma once

#include <nlohmann/json.hpp>
#include <reflect>
#include <string>
#include <type_traits>

namespace CarveSim {

/**
 * JSON conversion for plain aggregates (config, frame stats, snapshots),
 * keyed by member name through qlibs/reflect. Member types must have their
 * own nlohmann hooks.
 */
namespace ReflectSerializer {

// Calls fn(name, member) for every member of obj, in declaration order.
template <typename T, typename Fn>
void forEachField(T& obj, Fn&& fn)
{
    reflect::for_each(
        [&](auto I) { fn(std::string(reflect::member_name<I>(obj)), reflect::get<I>(obj)); },
        obj);
}

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();
    forEachField(obj, [&j](const std::string& name, const auto& member) { j[name] = member; });
    return j;
}

// Members named in j replace those of base; the rest, and unknown keys, are ignored.
template <typename T>
T merge_json(const T& base, const nlohmann::json& j)
{
    T result = base;
    forEachField(result, [&j](const std::string& name, auto& member) {
        const auto it = j.find(name);
        if (it != j.end()) {
            member = it->template get<std::remove_cvref_t<decltype(member)>>();
        }
    });
    return result;
}

// Members absent from j stay value-initialized.
template <typename T>
T from_json(const nlohmann::json& j)
{
    return merge_json(T{}, j);
}

} // namespace ReflectSerializer

} // namespace CarveSim
