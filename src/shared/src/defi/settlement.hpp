#pragma once
#include "codec/encrypted_value.hpp"
#include "crypto/crypto.hpp"
#include "matching.hpp"
#include <vector>

namespace defi {

struct Settlement {
  BatchId batchId;
  std::vector<InternalizedTransfer> internalizedTransfers;
  std::vector<NetSwap> netSwaps;
  // expired or undecodable intents, never matched
  std::vector<IntentId> excludedIntentIds;

  // Digest committee members sign. Covers the cleartext content in
  // matcher output order, so honest members computing from the same
  // batch obtain identical hashes.
  [[nodiscard]] SettlementHash hash() const;
};

struct CommitteeSignature {
  Address operatorId;
  RecoverableSignature signature;
};

// transfer amounts re-encrypted for publication
struct EncryptedTransferAmounts {
  codec::EncryptedValue amountA;
  codec::EncryptedValue amountB;
};

// everything submitted to the ledger for one batch
struct SettlementSubmission {
  Settlement settlement;
  std::vector<CommitteeSignature> signatures;
  std::vector<EncryptedTransferAmounts> encryptedAmounts; // parallel to transfers
};

} // namespace defi
