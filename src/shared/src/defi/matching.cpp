#include "matching.hpp"
#include <algorithm>
#include <deque>
#include <map>

namespace defi {
namespace {
struct Resting {
  size_t index; // into the input vector
  BigUint remaining;
};

struct DirectedPair {
  Address tokenIn;
  Address tokenOut;
  auto operator<=>(const DirectedPair &) const = default;
};

class Book {
public:
  // queue for the pair, created on first use
  std::deque<Resting> &queue(const DirectedPair &p) {
    auto iter{index.find(p)};
    if (iter == index.end()) {
      iter = index.emplace(p, queues.size()).first;
      queues.push_back({p, {}});
    }
    return queues[iter->second].second;
  }
  std::deque<Resting> *find(const DirectedPair &p) {
    auto iter{index.find(p)};
    if (iter == index.end())
      return nullptr;
    return &queues[iter->second].second;
  }
  // in order of first appearance, which keeps the output deterministic
  auto &all() const { return queues; }

private:
  std::map<DirectedPair, size_t> index;
  std::vector<std::pair<DirectedPair, std::deque<Resting>>> queues;
};
} // namespace

MatchResult match(const std::vector<MatchInput> &intents) {
  MatchResult res;
  Book book;

  for (size_t i = 0; i < intents.size(); ++i) {
    auto &in{intents[i]};
    BigUint remaining{in.amount};
    if (remaining.is_zero())
      continue;

    if (in.tokenIn != in.tokenOut) {
      auto *reverse{book.find({in.tokenOut, in.tokenIn})};
      while (reverse && !reverse->empty() && !remaining.is_zero()) {
        Resting head{std::move(reverse->front())};
        reverse->pop_front();
        auto &j{intents[head.index]};
        auto matched{std::min(remaining, head.remaining)};
        res.transfers.push_back({.intentIdA = j.id,
                                 .intentIdB = in.id,
                                 .userA = j.user,
                                 .userB = in.user,
                                 .tokenA = j.tokenIn,
                                 .tokenB = in.tokenIn,
                                 .amountA = matched,
                                 .amountB = matched});
        remaining -= matched;
        head.remaining -= matched;
        if (!head.remaining.is_zero())
          reverse->push_front(std::move(head)); // keeps oldest-first priority
      }
    }

    if (!remaining.is_zero())
      book.queue({in.tokenIn, in.tokenOut}).push_back({i, remaining});
  }

  for (auto &[pair, q] : book.all()) {
    if (q.empty())
      continue;
    NetSwap ns{.tokenIn = pair.tokenIn,
               .tokenOut = pair.tokenOut,
               .netAmount = BigUint(0),
               .remainingIntentIds = {}};
    for (auto &r : q) {
      ns.netAmount += r.remaining;
      ns.remainingIntentIds.push_back(intents[r.index].id);
    }
    res.netSwaps.push_back(std::move(ns));
  }
  return res;
}

bool check_conservation(const std::vector<MatchInput> &intents,
                        const MatchResult &result) {
  std::map<Address, BigUint> in, out;
  for (auto &i : intents)
    in[i.tokenIn] += i.amount;
  for (auto &t : result.transfers) {
    out[t.tokenA] += t.amountA;
    out[t.tokenB] += t.amountB;
  }
  for (auto &n : result.netSwaps)
    out[n.tokenIn] += n.netAmount;

  // tokens with zero totals may be absent on one side
  auto nonzero{[](const std::map<Address, BigUint> &m) {
    std::map<Address, BigUint> r;
    for (auto &[k, v] : m)
      if (!v.is_zero())
        r.emplace(k, v);
    return r;
  }};
  return nonzero(in) == nonzero(out);
}

} // namespace defi
