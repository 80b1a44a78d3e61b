#include "types.h"

#include <sstream>
#include <type_traits>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace Lockstep {

bool operator==(const Transition& a, const Transition& b) {
    return a.done == b.done &&
           a.observations == b.observations &&
           a.rewards == b.rewards &&
           a.info == b.info &&
           a.delegate_info == b.delegate_info;
}

std::optional<double> AsNumber(const Attribute& value) {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* b = std::get_if<bool>(&value)) return *b ? 1.0 : 0.0;
    return std::nullopt;
}

double GetNumber(const AttributeMap& map, const std::string& key, double fallback) {
    auto it = map.find(key);
    if (it == map.end()) return fallback;
    return AsNumber(it->second).value_or(fallback);
}

bool GetBool(const AttributeMap& map, const std::string& key, bool fallback) {
    auto it = map.find(key);
    if (it == map.end()) return fallback;
    if (const auto* b = std::get_if<bool>(&it->second)) return *b;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return *i != 0;
    return fallback;
}

std::string GetString(const AttributeMap& map, const std::string& key, const std::string& fallback) {
    auto it = map.find(key);
    if (it == map.end()) return fallback;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return fallback;
}

std::string ToString(const Attribute& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::vector<double>>) {
            return absl::StrCat("[", absl::StrJoin(v, ","), "]");
        } else {
            std::ostringstream out;
            out << v;
            return out.str();
        }
    }, value);
}

std::string ToString(const AttributeMap& map) {
    return absl::StrCat("{", absl::StrJoin(map, ", ",
        [](std::string* out, const auto& entry) {
            absl::StrAppend(out, entry.first, "=", ToString(entry.second));
        }), "}");
}

uint64_t DeriveSeed(uint64_t base_seed, const std::string& salt) {
    // FNV-1a over the salt; absl::Hash is salted per process and would break replay
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : salt) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    uint64_t z = base_seed ^ h;
    z += 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

} // namespace Lockstep
