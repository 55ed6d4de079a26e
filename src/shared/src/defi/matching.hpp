#pragma once
#include "batch/ids.hpp"
#include "crypto/address.hpp"
#include "general/big_uint.hpp"
#include <vector>

namespace defi {

// decrypted intent as seen by the matcher
struct MatchInput {
  IntentId id;
  Address user;
  Address tokenIn;
  Address tokenOut;
  BigUint amount;
};

// Trade between two intents of opposite direction. Side A is the resting
// (earlier) intent, side B the incoming one. amountA is paid in tokenA,
// amountB in tokenB.
struct InternalizedTransfer {
  IntentId intentIdA;
  IntentId intentIdB;
  Address userA;
  Address userB;
  Address tokenA;
  Address tokenB;
  BigUint amountA;
  BigUint amountB;
};

struct NetSwap {
  Address tokenIn;
  Address tokenOut;
  BigUint netAmount;
  std::vector<IntentId> remainingIntentIds; // FIFO order
};

struct MatchResult {
  std::vector<InternalizedTransfer> transfers;
  std::vector<NetSwap> netSwaps; // one per non-empty directed pair
};

// FIFO matching per directed token pair. Amounts of different tokens are
// compared as raw integers, no price or decimals normalization.
[[nodiscard]] MatchResult match(const std::vector<MatchInput> &intents);

// per token: sum(input amounts) == sum(transfer legs) + sum(net swaps)
[[nodiscard]] bool check_conservation(const std::vector<MatchInput> &intents,
                                      const MatchResult &result);

} // namespace defi
