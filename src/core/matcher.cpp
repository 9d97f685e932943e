#include "qmatch/matcher.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <stdexcept>
#include <thread>

namespace qmatch {

namespace {

constexpr int kFallbackWorkers = 4;
constexpr unsigned kWorkerCap = 256;

using WindowScanner = std::function<void(int queryOffset, std::vector<MatchPair>& out, MatchStats& stats)>;

bool cancelRequested(const MatchRequest& request) {
  return request.cancel != nullptr && request.cancel->load(std::memory_order_relaxed);
}

void scanLmerWindow(const std::string& query,
                    const std::string& text,
                    int i,
                    int n,
                    int k,
                    int l,
                    std::vector<MatchPair>& out,
                    MatchStats& stats) {
  const std::string block = query.substr(static_cast<std::size_t>(i), static_cast<std::size_t>(n));
  const SeedIndex index = buildSeedIndex(block, l);
  const int m = static_cast<int>(text.size());
  ++stats.windowsScanned;

  std::string lmer;
  for (int j = 0; j + l <= m; ++j) {
    lmer.assign(text, static_cast<std::size_t>(j), static_cast<std::size_t>(l));
    auto it = index.find(lmer);
    if (it == index.end()) {
      continue;
    }
    ++stats.seedHits;
    for (int r : it->second) {
      ++stats.candidates;
      const int j0 = j - r;
      if (j0 < 0 || j0 + n > m) {
        ++stats.outOfBounds;
        continue;
      }
      ++stats.verified;
      if (hammingDistance(block, 0, text, j0, n, k) <= k) {
        ++stats.accepted;
        out.push_back(MatchPair{i + 1, j0 + 1});
      }
    }
  }
}

void scanBruteWindow(const std::string& query,
                     const std::string& text,
                     int i,
                     int n,
                     int k,
                     std::vector<MatchPair>& out,
                     MatchStats& stats) {
  const int m = static_cast<int>(text.size());
  ++stats.windowsScanned;
  for (int j = 0; j + n <= m; ++j) {
    ++stats.verified;
    if (hammingDistance(query, i, text, j, n, k) <= k) {
      ++stats.accepted;
      out.push_back(MatchPair{i + 1, j + 1});
    }
  }
}

// Upper bound on worker threads regardless of the requested count.
int maxWorkers() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? kFallbackWorkers : static_cast<int>(std::min<unsigned>(hw * 2, kWorkerCap));
}

// Runs `scan` for every query window, sharding windows across request.threads
// workers. Each worker owns its pairs and stats; they are merged after join.
MatchResult runWindows(const MatchRequest& request, const WindowScanner& scan) {
  MatchResult result;
  const int windows = static_cast<int>(request.query.size()) - request.n + 1;
  const int workers = std::max(1, std::min({request.threads, windows, maxWorkers()}));

  struct Shard {
    std::vector<MatchPair> pairs;
    MatchStats stats;
    bool cancelled{false};
    std::exception_ptr error;
  };
  std::vector<Shard> shards(static_cast<std::size_t>(workers));

  auto runShard = [&request, &scan](Shard& shard, int begin, int end) {
    try {
      for (int i = begin; i < end; ++i) {
        if (cancelRequested(request)) {
          shard.cancelled = true;
          return;
        }
        scan(i, shard.pairs, shard.stats);
      }
    } catch (...) {
      shard.error = std::current_exception();
    }
  };

  if (workers == 1) {
    runShard(shards[0], 0, windows);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(workers));
    const int chunk = windows / workers;
    const int extra = windows % workers;
    int begin = 0;
    try {
      for (int w = 0; w < workers; ++w) {
        const int end = begin + chunk + (w < extra ? 1 : 0);
        pool.emplace_back(runShard, std::ref(shards[static_cast<std::size_t>(w)]), begin, end);
        begin = end;
      }
    } catch (...) {
      // A failed launch must not leave joinable threads behind.
      for (auto& t : pool) {
        t.join();
      }
      throw;
    }
    for (auto& t : pool) {
      t.join();
    }
  }

  for (auto& shard : shards) {
    if (shard.error) {
      std::rethrow_exception(shard.error);
    }
  }

  for (auto& shard : shards) {
    result.stats += shard.stats;
    result.cancelled = result.cancelled || shard.cancelled;
    result.pairs.insert(result.pairs.end(), shard.pairs.begin(), shard.pairs.end());
  }
  if (result.cancelled) {
    result.pairs.clear();
    return result;
  }
  finalizeMatches(result.pairs);
  return result;
}

void validateRequest(const MatchRequest& request) {
  validateMatchParams(request.n, request.k);
  if (request.threads < 1) {
    throw std::invalid_argument("threads must be >= 1, got " + std::to_string(request.threads));
  }
}

bool lengthsFeasible(const MatchRequest& request) {
  return request.n <= static_cast<int>(request.query.size()) && request.n <= static_cast<int>(request.text.size());
}

}  // namespace

const char* methodName(MatchMethod method) {
  switch (method) {
    case MatchMethod::LmerFilter: return "lmer";
    case MatchMethod::BruteForce: return "brute";
  }
  return "unknown";
}

MatchMethod parseMethod(const std::string& name) {
  if (name == "lmer") {
    return MatchMethod::LmerFilter;
  }
  if (name == "brute") {
    return MatchMethod::BruteForce;
  }
  throw std::invalid_argument("Unknown match method: " + name + " (expected lmer or brute)");
}

void validateMatchParams(int n, int k) {
  if (n <= 0) {
    throw std::invalid_argument("n must be positive, got " + std::to_string(n));
  }
  if (k < 0) {
    throw std::invalid_argument("k must be non-negative, got " + std::to_string(k));
  }
  if (k >= n) {
    throw std::invalid_argument("k must be smaller than n (n=" + std::to_string(n) + ", k=" + std::to_string(k) +
                                "), otherwise the seed length is zero");
  }
}

int seedLength(int n, int k) {
  validateMatchParams(n, k);
  return n / (k + 1);
}

SeedIndex buildSeedIndex(const std::string& block, int l) {
  if (l <= 0) {
    throw std::invalid_argument("seed length must be positive");
  }
  SeedIndex index;
  const int n = static_cast<int>(block.size());
  for (int r = 0; r + l <= n; ++r) {
    index[block.substr(static_cast<std::size_t>(r), static_cast<std::size_t>(l))].push_back(r);
  }
  return index;
}

int hammingDistance(const std::string& a, int aStart, const std::string& b, int bStart, int len, int limit) {
  if (aStart < 0 || bStart < 0 || len < 0 || static_cast<std::size_t>(aStart) + len > a.size() ||
      static_cast<std::size_t>(bStart) + len > b.size()) {
    throw std::out_of_range("Hamming window exceeds sequence bounds");
  }
  int mismatches = 0;
  for (int x = 0; x < len; ++x) {
    if (a[static_cast<std::size_t>(aStart + x)] != b[static_cast<std::size_t>(bStart + x)]) {
      ++mismatches;
      if (limit >= 0 && mismatches > limit) {
        break;
      }
    }
  }
  return mismatches;
}

int hammingDistance(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("Hamming distance needs equal lengths (" + std::to_string(a.size()) + " vs " +
                                std::to_string(b.size()) + ")");
  }
  return hammingDistance(a, 0, b, 0, static_cast<int>(a.size()));
}

void finalizeMatches(std::vector<MatchPair>& pairs) {
  std::sort(pairs.begin(), pairs.end());
  pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
}

MatchResult LmerFilterMatcher::match(const MatchRequest& request) const {
  validateRequest(request);
  const int l = seedLength(request.n, request.k);
  if (!lengthsFeasible(request)) {
    MatchResult empty;
    empty.seedLength = l;
    return empty;
  }

  MatchResult result = runWindows(request, [&request, l](int i, std::vector<MatchPair>& out, MatchStats& stats) {
    scanLmerWindow(request.query, request.text, i, request.n, request.k, l, out, stats);
  });
  result.seedLength = l;
  return result;
}

MatchResult BruteForceMatcher::match(const MatchRequest& request) const {
  validateRequest(request);
  if (!lengthsFeasible(request)) {
    return {};
  }
  return runWindows(request, [&request](int i, std::vector<MatchPair>& out, MatchStats& stats) {
    scanBruteWindow(request.query, request.text, i, request.n, request.k, out, stats);
  });
}

std::vector<MatchPair> queryMatch(const std::string& query, const std::string& text, int n, int k) {
  MatchRequest request;
  request.query = query;
  request.text = text;
  request.n = n;
  request.k = k;
  return LmerFilterMatcher().match(request).pairs;
}

}  // namespace qmatch
