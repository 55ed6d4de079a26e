#pragma once
#include "codec/encrypted_value.hpp"
#include "crypto/address.hpp"
#include "ids.hpp"

struct Intent {
    IntentId id;
    Address submitter;
    Address tokenIn;
    Address tokenOut;
    codec::EncryptedValue encryptedAmount;
    PoolId poolId;
    BlockNumber submittedAt;
    BlockNumber deadline;

    // Expiry is judged against the batch's finalization block, so that
    // every committee member reaches the same verdict.
    bool expired_at(BlockNumber b) const { return deadline < b; }
};
