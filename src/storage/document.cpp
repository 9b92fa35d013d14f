#include "storage/document.h"

#include <algorithm>
#include <cctype>

namespace vesta {

using json = nlohmann::ordered_json;

int typeRank(const json& v) {
    switch (v.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return 0;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return 1;
        case json::value_t::string:
            return 2;
        case json::value_t::object:
            return 3;
        case json::value_t::array:
        case json::value_t::binary:
            return 4;
        case json::value_t::boolean:
            return 5;
    }
    return 0;
}

int compareValues(const json& a, const json& b) {
    int ra = typeRank(a);
    int rb = typeRank(b);
    if (ra != rb) return ra < rb ? -1 : 1;

    switch (ra) {
        case 0:
            return 0;
        case 1: {
            if (a.is_number_float() || b.is_number_float()) {
                double da = a.get<double>();
                double db = b.get<double>();
                return da < db ? -1 : (da > db ? 1 : 0);
            }
            if (a.is_number_unsigned() && b.is_number_unsigned()) {
                auto ua = a.get<uint64_t>();
                auto ub = b.get<uint64_t>();
                return ua < ub ? -1 : (ua > ub ? 1 : 0);
            }
            // Mixed signed/unsigned: values beyond int64 only come from unsigned
            if (a.is_number_unsigned() && a.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) return 1;
            if (b.is_number_unsigned() && b.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) return -1;
            auto ia = a.get<int64_t>();
            auto ib = b.get<int64_t>();
            return ia < ib ? -1 : (ia > ib ? 1 : 0);
        }
        case 2: {
            int c = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case 5: {
            bool ba = a.get<bool>();
            bool bb = b.get<bool>();
            return ba == bb ? 0 : (ba ? 1 : -1);
        }
        default: {
            if (a == b) return 0;
            int c = a.dump().compare(b.dump());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
}

json zeroLike(const json& v) {
    switch (typeRank(v)) {
        case 1: return 0;
        case 2: return "";
        case 3: return json::object();
        case 4: return json::array();
        case 5: return false;
        default: return nullptr;
    }
}

void sortDocuments(std::vector<Document>& docs, const SortSpec& sort,
                   const std::optional<json>& missing_default) {
    const std::string& field = sort.field;
    const bool desc = sort.direction == SortDirection::DESCENDING;

    auto keyOf = [&](const Document& d) -> const json* {
        if (!d.is_object()) return nullptr;
        auto it = d.find(field);
        return it == d.end() ? nullptr : &(*it);
    };

    // Every missing key sorts as the same value
    json fallback = nullptr;
    if (missing_default) {
        fallback = *missing_default;
    } else {
        for (const auto& d : docs) {
            if (const json* k = keyOf(d)) {
                fallback = zeroLike(*k);
                break;
            }
        }
    }

    std::stable_sort(docs.begin(), docs.end(), [&](const Document& l, const Document& r) {
        const json* lk = keyOf(l);
        const json* rk = keyOf(r);
        int c;
        if (!lk && !rk) {
            c = 0;
        } else {
            c = compareValues(lk ? *lk : fallback, rk ? *rk : fallback);
        }
        return desc ? c > 0 : c < 0;
    });
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

} // namespace vesta
