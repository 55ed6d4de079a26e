#pragma once
#include "crypto/hash.hpp"
#include <cstdint>

using BlockNumber = uint64_t;

class IntentId : public GenericHash<IntentId> {
public:
    using GenericHash::GenericHash;
};

class BatchId : public GenericHash<BatchId> {
public:
    using GenericHash::GenericHash;
};

class PoolId : public GenericHash<PoolId> {
public:
    using GenericHash::GenericHash;
};

// position of the ledger at the time of an operation
struct Tip {
    BlockNumber height;
    uint64_t timestamp; // unix seconds
};
