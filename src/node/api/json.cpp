#include "json.hpp"
#include "general/hex.hpp"

namespace jsonmsg {

json to_json(const Hash& h)
{
    return h.hex_string();
}

json to_json(const Address& a)
{
    return a.to_string();
}

json to_json(const BigUint& u)
{
    return u.to_string();
}

json to_json(const codec::EncryptedValue& ev)
{
    return json {
        { "handle", ev.handle.hex_string() },
        { "type", std::string(codec::tag_name(ev.tag)) },
        { "securityZone", ev.securityZone },
        { "proof", "0x" + serialize_hex(ev.proof) },
    };
}

json to_json(const Batch& b)
{
    json j;
    j["id"] = to_json(b.id);
    j["poolId"] = to_json(b.poolId);
    j["state"] = std::string(state_name(b.state));
    j["createdAt"] = b.createdAt;
    j["lastIntentAt"] = b.lastIntentAt;
    j["lastIntentTimestamp"] = b.lastIntentTimestamp;
    if (b.finalizedAt)
        j["finalizedAt"] = *b.finalizedAt;
    else
        j["finalizedAt"] = nullptr;
    j["intentIds"] = to_json(b.intentIds, [](const IntentId& id) { return to_json(id); });
    return j;
}

json to_json(const Intent& i)
{
    return json {
        { "id", i.id.hex_string() },
        { "submitter", i.submitter.to_string() },
        { "tokenIn", i.tokenIn.to_string() },
        { "tokenOut", i.tokenOut.to_string() },
        { "encryptedAmount", to_json(i.encryptedAmount) },
        { "poolId", i.poolId.hex_string() },
        { "submittedAt", i.submittedAt },
        { "deadline", i.deadline },
    };
}

json to_json(const defi::InternalizedTransfer& t)
{
    return json {
        { "intentIdA", t.intentIdA.hex_string() },
        { "intentIdB", t.intentIdB.hex_string() },
        { "userA", t.userA.to_string() },
        { "userB", t.userB.to_string() },
        { "tokenA", t.tokenA.to_string() },
        { "tokenB", t.tokenB.to_string() },
        { "amountA", t.amountA.to_string() },
        { "amountB", t.amountB.to_string() },
    };
}

json to_json(const defi::NetSwap& n)
{
    return json {
        { "tokenIn", n.tokenIn.to_string() },
        { "tokenOut", n.tokenOut.to_string() },
        { "netAmount", n.netAmount.to_string() },
        { "remainingIntentIds", to_json(n.remainingIntentIds, [](const IntentId& id) { return to_json(id); }) },
    };
}

json to_json(const defi::Settlement& s)
{
    json j;
    j["batchId"] = s.batchId.hex_string();
    j["hash"] = s.hash().hex_string();
    j["internalizedTransfers"] = to_json(s.internalizedTransfers);
    j["netSwaps"] = to_json(s.netSwaps);
    j["excludedIntentIds"] = to_json(s.excludedIntentIds, [](const IntentId& id) { return to_json(id); });
    return j;
}

json to_json(const defi::CommitteeSignature& s)
{
    return json {
        { "operator", s.operatorId.to_string() },
        { "signature", "0x" + s.signature.to_string() },
    };
}

json to_json(const defi::SettlementSubmission& s)
{
    json j = to_json(s.settlement);
    j["signatures"] = to_json(s.signatures);
    json amounts = json::array();
    for (auto& e : s.encryptedAmounts) {
        amounts.push_back(json {
            { "amountA", to_json(e.amountA) },
            { "amountB", to_json(e.amountB) },
        });
    }
    j["encryptedAmounts"] = amounts;
    return j;
}

}
