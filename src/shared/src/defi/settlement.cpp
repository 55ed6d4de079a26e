#include "settlement.hpp"
#include "crypto/hasher_sha256.hpp"

namespace defi {
namespace {
std::span<const uint8_t> as_span(const std::array<uint8_t, 32> &a) {
  return {a.data(), a.size()};
}
} // namespace

SettlementHash Settlement::hash() const {
  HasherSHA256 h;
  h << std::string_view("veilbatch/settlement/v1") << batchId;

  h << uint32_t(internalizedTransfers.size());
  for (auto &t : internalizedTransfers) {
    auto a{t.amountA.to_be_bytes()};
    auto b{t.amountB.to_be_bytes()};
    h << t.intentIdA << t.intentIdB << t.userA << t.userB << t.tokenA
      << t.tokenB << as_span(a) << as_span(b);
  }

  h << uint32_t(netSwaps.size());
  for (auto &n : netSwaps) {
    auto amount{n.netAmount.to_be_bytes()};
    h << n.tokenIn << n.tokenOut << as_span(amount)
      << uint32_t(n.remainingIntentIds.size());
    for (auto &id : n.remainingIntentIds)
      h << id;
  }

  h << uint32_t(excludedIntentIds.size());
  for (auto &id : excludedIntentIds)
    h << id;
  return SettlementHash{static_cast<Hash>(std::move(h))};
}

} // namespace defi
