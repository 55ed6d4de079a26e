#pragma once
#include "batch/batch.hpp"
#include "batch/intent.hpp"
#include "defi/settlement.hpp"
#include "general/errors.hpp"
#include "general/result.hpp"
#include "nlohmann/json.hpp"
#include <vector>

namespace jsonmsg {
using namespace nlohmann;

json to_json(const Hash&);
json to_json(const Address&);
json to_json(const BigUint&);
json to_json(const codec::EncryptedValue&);
json to_json(const Batch&);
json to_json(const Intent&);
json to_json(const defi::InternalizedTransfer&);
json to_json(const defi::NetSwap&);
json to_json(const defi::Settlement&);
json to_json(const defi::CommitteeSignature&);
json to_json(const defi::SettlementSubmission&);
inline json to_json(const json& j) { return j; }

template <typename T>
inline json to_json(const std::vector<T>& e, const auto& map)
{
    json j = json::array();
    for (auto& item : e) {
        j.push_back(to_json(map(item)));
    }
    return j;
}

template <typename T>
inline json to_json(const std::vector<T>& e)
{
    return to_json(e, std::identity());
}

inline std::string status(Error e)
{
    nlohmann::json j;
    j["code"] = e.code;
    if (e.is_error()) {
        j["error"] = e.strerror();
    } else {
        j["error"] = nullptr;
    }
    return j.dump(1);
}

template <typename T>
inline std::string serialize(const Result<T>& e)
{
    if (!e.has_value())
        return status(e.error());
    json j;
    j["code"] = 0;
    j["data"] = to_json(e.value());
    return j.dump(1);
}

}
