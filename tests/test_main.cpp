#include "qmatch/dna_generator.hpp"
#include "qmatch/facade.hpp"
#include "qmatch/fasta_io.hpp"
#include "qmatch/matcher.hpp"
#include "qmatch/options.hpp"
#include "qmatch/report.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <climits>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using qmatch::MatchPair;

namespace {

std::vector<MatchPair> naiveMatch(const std::string& q, const std::string& t, int n, int k) {
  std::vector<MatchPair> out;
  const int p = static_cast<int>(q.size());
  const int m = static_cast<int>(t.size());
  for (int i = 0; i + n <= p; ++i) {
    for (int j = 0; j + n <= m; ++j) {
      int d = 0;
      for (int x = 0; x < n; ++x) {
        if (q[i + x] != t[j + x]) {
          ++d;
        }
      }
      if (d <= k) {
        out.push_back(MatchPair{i + 1, j + 1});
      }
    }
  }
  return out;
}

bool contains(const std::vector<MatchPair>& pairs, int qs, int ts) {
  return std::find(pairs.begin(), pairs.end(), MatchPair{qs, ts}) != pairs.end();
}

template <typename Fn>
bool throwsInvalidArgument(Fn fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

std::string randomOver(const std::string& alphabet, int length, std::mt19937& rng) {
  std::uniform_int_distribution<int> pick(0, static_cast<int>(alphabet.size()) - 1);
  std::string s;
  for (int i = 0; i < length; ++i) {
    s.push_back(alphabet[static_cast<std::size_t>(pick(rng))]);
  }
  return s;
}

std::string readAll(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

int main() {
  // Exact 4-mers shared by a query and a text.
  {
    const std::string q = "AACGTACGT";
    const std::string t = "TTACGTACGTTT";
    const auto hits = qmatch::queryMatch(q, t, 4, 0);
    const std::vector<MatchPair> expected = {{2, 3}, {2, 7}, {3, 4}, {4, 5}, {5, 2}, {5, 6}, {6, 3}, {6, 7}};
    assert(hits == expected);
    assert(hits == naiveMatch(q, t, 4, 0));
  }

  // One substitution is accepted only with a mismatch budget.
  {
    const auto one = qmatch::queryMatch("AAAA", "AAAT", 4, 1);
    assert(one.size() == 1);
    assert(one[0] == (MatchPair{1, 1}));
    assert(qmatch::queryMatch("AAAA", "AAAT", 4, 0).empty());
  }

  // Windows longer than either input yield nothing.
  {
    assert(qmatch::queryMatch("ACG", "ACGTACGT", 4, 0).empty());
    assert(qmatch::queryMatch("ACGTACGT", "ACG", 4, 1).empty());
    assert(qmatch::queryMatch("", "", 1, 0).empty());
  }

  // Parameters that leave no usable seed are rejected before any work.
  {
    assert(throwsInvalidArgument([] { qmatch::queryMatch("ACGT", "ACGT", 0, 0); }));
    assert(throwsInvalidArgument([] { qmatch::queryMatch("ACGT", "ACGT", 4, -1); }));
    assert(throwsInvalidArgument([] { qmatch::queryMatch("ACGT", "ACGT", 3, 3); }));
    assert(throwsInvalidArgument([] { qmatch::queryMatch("A", "A", 3, 5); }));
    assert(throwsInvalidArgument([] { qmatch::queryMatch("ACGT", "ACGT", 4, INT_MAX); }));
    assert(throwsInvalidArgument([] { qmatch::seedLength(INT_MAX, INT_MAX); }));
    assert(qmatch::seedLength(15, 2) == 5);
    assert(qmatch::seedLength(4, 0) == 4);
    assert(qmatch::seedLength(7, 6) == 1);

    qmatch::MatchRequest req;
    req.query = "ACGT";
    req.text = "ACGT";
    req.n = 2;
    req.k = 0;
    req.threads = 0;
    assert(throwsInvalidArgument([&req] { qmatch::LmerFilterMatcher().match(req); }));
    assert(throwsInvalidArgument([] { qmatch::parseMethod("suffix-tree"); }));
    assert(qmatch::parseMethod("brute") == qmatch::MatchMethod::BruteForce);
  }

  // Seed index keeps every offset of a repeated l-mer in ascending order.
  {
    const auto index = qmatch::buildSeedIndex("ACACA", 2);
    assert(index.size() == 2);
    assert(index.at("AC") == (std::vector<int>{0, 2}));
    assert(index.at("CA") == (std::vector<int>{1, 3}));
    assert(qmatch::buildSeedIndex("ACGT", 4).size() == 1);
  }

  // Hamming distance, with and without early exit.
  {
    assert(qmatch::hammingDistance("ACGT", "ACGT") == 0);
    assert(qmatch::hammingDistance("ACGT", "TGCA") == 4);
    assert(qmatch::hammingDistance("ACGT", 0, "TGCA", 0, 4, 1) == 2);
    assert(qmatch::hammingDistance("xxACGT", 2, "ACCT", 0, 4) == 1);
    assert(throwsInvalidArgument([] { qmatch::hammingDistance("ACG", "ACGT"); }));
    bool outOfRange = false;
    try {
      qmatch::hammingDistance("ACGT", 2, "ACGT", 0, 4);
    } catch (const std::out_of_range&) {
      outOfRange = true;
    }
    assert(outOfRange);
  }

  // Filtration agrees with brute force on random inputs: no misses, no extras.
  {
    std::mt19937 rng(7);
    const std::vector<std::string> alphabets = {"ACGT", "AC", "A"};
    for (int round = 0; round < 60; ++round) {
      const std::string& alphabet = alphabets[static_cast<std::size_t>(round) % alphabets.size()];
      const int p = 5 + round % 17;
      const int m = 8 + (round * 7) % 41;
      const std::string q = randomOver(alphabet, p, rng);
      const std::string t = randomOver(alphabet, m, rng);
      for (int n = 1; n <= std::min(p, 9); ++n) {
        for (int k = 0; k < n && k <= 3; ++k) {
          const auto hits = qmatch::queryMatch(q, t, n, k);
          assert(hits == naiveMatch(q, t, n, k));
          for (const auto& h : hits) {
            assert(h.queryStart >= 1 && h.queryStart <= p - n + 1);
            assert(h.textStart >= 1 && h.textStart <= m - n + 1);
          }
        }
      }
    }
  }

  // A sequence matches itself at every aligned offset.
  {
    std::mt19937 rng(11);
    const std::string s = qmatch::randomDna(40, rng);
    for (int n = 1; n <= 12; ++n) {
      const auto hits = qmatch::queryMatch(s, s, n, 0);
      for (int i = 0; i + n <= static_cast<int>(s.size()); ++i) {
        assert(contains(hits, i + 1, i + 1));
      }
    }
  }

  // Repeated runs and threaded runs give the same ordered output.
  {
    std::mt19937 rng(3);
    qmatch::MatchRequest req;
    req.query = qmatch::randomDna(120, rng);
    req.text = qmatch::randomDna(900, rng) + req.query.substr(30, 40) + qmatch::randomDna(200, rng);
    req.n = 12;
    req.k = 2;

    qmatch::LmerFilterMatcher matcher;
    const auto base = matcher.match(req);
    assert(base.seedLength == 4);
    assert(!base.pairs.empty());
    assert(matcher.match(req).pairs == base.pairs);
    assert(std::is_sorted(base.pairs.begin(), base.pairs.end()));
    assert(base.stats.windowsScanned == 120 - 12 + 1);
    assert(base.stats.candidates == base.stats.outOfBounds + base.stats.verified);
    assert(base.stats.accepted >= static_cast<long long>(base.pairs.size()));

    for (int threads : {2, 3, 8, 500}) {
      req.threads = threads;
      const auto threaded = matcher.match(req);
      assert(threaded.pairs == base.pairs);
      assert(threaded.stats.verified == base.stats.verified);
    }

    req.threads = 4;
    const auto brute = qmatch::BruteForceMatcher().match(req);
    assert(brute.pairs == base.pairs);
    assert(brute.stats.verified == static_cast<long long>(120 - 12 + 1) * (static_cast<long long>(req.text.size()) - 12 + 1));
  }

  // Thread counts far above the core count are capped, not spawned one per window.
  {
    qmatch::MatchRequest req;
    req.query = std::string(5000, 'A');
    req.text = std::string(100, 'A');
    req.n = 10;
    req.k = 1;
    const auto single = qmatch::LmerFilterMatcher().match(req);
    assert(single.pairs.size() == static_cast<std::size_t>(4991 * 91));
    req.threads = 4000;
    const auto wide = qmatch::LmerFilterMatcher().match(req);
    assert(wide.pairs == single.pairs);
    assert(wide.stats.windowsScanned == single.stats.windowsScanned);
  }

  // A cancel raised while workers run ends the search either whole or empty.
  {
    std::mt19937 rng(19);
    std::atomic<bool> cancel{false};
    qmatch::MatchRequest req;
    req.query = qmatch::randomDna(3000, rng);
    req.text = qmatch::randomDna(20000, rng);
    req.n = 12;
    req.k = 3;
    req.threads = 4;
    const auto full = qmatch::LmerFilterMatcher().match(req);

    req.cancel = &cancel;
    qmatch::MatchResult r;
    std::thread worker([&req, &r] { r = qmatch::LmerFilterMatcher().match(req); });
    cancel = true;
    worker.join();
    if (r.cancelled) {
      assert(r.pairs.empty());
      assert(r.stats.windowsScanned < full.stats.windowsScanned);
    } else {
      assert(r.pairs == full.pairs);
    }
  }

  // A raised cancel flag stops the search without partial results.
  {
    std::atomic<bool> cancel{true};
    qmatch::MatchRequest req;
    req.query = "ACGTACGTAC";
    req.text = "ACGTACGTACGTACGT";
    req.n = 4;
    req.k = 1;
    req.cancel = &cancel;
    for (int threads : {1, 3}) {
      req.threads = threads;
      const auto r = qmatch::LmerFilterMatcher().match(req);
      assert(r.cancelled);
      assert(r.pairs.empty());
    }
    cancel = false;
    const auto r = qmatch::LmerFilterMatcher().match(req);
    assert(!r.cancelled);
    assert(!r.pairs.empty());
  }

  // Demo generator: injected randomness, embedded n-mer always found.
  {
    std::mt19937 rng(5);
    const std::string seq = qmatch::randomDna(30, rng);
    assert(seq.size() == 30);
    assert(seq.find_first_not_of("ACGT") == std::string::npos);
    const std::string mutated = qmatch::mutateDna(seq, 3, rng);
    assert(mutated.size() == seq.size());
    assert(qmatch::hammingDistance(seq, mutated) <= 3);
    assert(qmatch::mutateDna(seq, 0, rng) == seq);

    qmatch::QueryMatchFacade facade;
    for (std::uint32_t seed = 0; seed < 40; ++seed) {
      const auto [demo, result] = facade.demo(qmatch::DemoParams{}, seed);
      assert(demo.text.size() == 200);
      assert(demo.query.size() == 60);
      assert(contains(result.pairs, demo.queryEmbedStart, demo.textEmbedStart));
    }

    const auto a = facade.demo(qmatch::DemoParams{}, 99);
    const auto b = facade.demo(qmatch::DemoParams{}, 99);
    assert(a.first.query == b.first.query);
    assert(a.first.text == b.first.text);
    assert(a.second.pairs == b.second.pairs);

    qmatch::DemoParams tight{15, 15, 15, 1};
    const auto [exact, exactResult] = facade.demo(tight, 1);
    assert(exact.query.size() == 15);
    assert(exact.queryEmbedStart == 1);
    assert(contains(exactResult.pairs, 1, 1));

    std::mt19937 r2(1);
    assert(throwsInvalidArgument([&r2] { qmatch::buildDemoCase(qmatch::DemoParams{10, 60, 15, 2}, r2); }));
  }

  // FASTA round trip and record selection.
  {
    const std::string path = "/tmp/qmatch_test.fa";
    {
      std::ofstream fa(path);
      fa << ">chr1 first record\nacgt\nACGT\n\n>chr2\nTTTT\nGG\n>chr1 duplicate\nCCCC\n";
    }
    const auto names = qmatch::readFastaNames(path);
    assert(names.size() == 2);
    assert(names[0] == "chr1");
    assert(qmatch::readFastaSequence(path, "") == "ACGTACGT");
    assert(qmatch::readFastaSequence(path, "chr2") == "TTTTGG");
    bool missing = false;
    try {
      qmatch::readFastaSequence(path, "chrX");
    } catch (const std::runtime_error&) {
      missing = true;
    }
    assert(missing);

    const std::string out = "/tmp/qmatch_test_out.fa";
    const std::string longSeq(170, 'G');
    qmatch::writeFasta(out, {{"long", longSeq}});
    const auto back = qmatch::readFasta(out);
    assert(back.size() == 1);
    assert(back.at("long") == longSeq);
  }

  // Facade reads query and text records from FASTA.
  {
    const std::string qPath = "/tmp/qmatch_query.fa";
    const std::string tPath = "/tmp/qmatch_text.fa";
    qmatch::writeFasta(qPath, {{"q", "AACGTACGT"}});
    qmatch::writeFasta(tPath, {{"t", "TTACGTACGTTT"}});

    qmatch::FastaMatchRequest freq;
    freq.queryFasta = qPath;
    freq.textFasta = tPath;
    freq.textSeq = "t";
    freq.n = 4;
    freq.k = 0;
    freq.method = qmatch::MatchMethod::BruteForce;
    const auto [req, result] = qmatch::QueryMatchFacade().matchFasta(freq);
    assert(req.query == "AACGTACGT");
    assert(result.pairs == qmatch::queryMatch("AACGTACGT", "TTACGTACGTTT", 4, 0));
  }

  // Reports recompute mismatches for display.
  {
    assert(qmatch::describeMatch("AAAA", "AAAT", MatchPair{1, 1}, 4) == "q[1:5] ~ t[1:5]  -> 1 mismatches");

    qmatch::MatchRequest req;
    req.query = "AAAA";
    req.text = "AAAT";
    req.n = 4;
    req.k = 1;
    const auto result = qmatch::LmerFilterMatcher().match(req);

    std::ostringstream printed;
    qmatch::printMatches(printed, req.query, req.text, req.n, result);
    assert(printed.str().find("Found matches") != std::string::npos);

    std::ostringstream none;
    qmatch::printMatches(none, req.query, req.text, req.n, qmatch::MatchResult{});
    assert(none.str() == "No matches found.\n");

    const std::string tsv = "/tmp/qmatch_test.tsv";
    qmatch::writeMatchTsv(tsv, req, result);
    assert(readAll(tsv) == "query_start\ttext_start\tmismatches\tquery_kmer\ttext_kmer\n1\t1\t1\tAAAA\tAAAT\n");

    const std::string json = "/tmp/qmatch_test.json";
    qmatch::writeMatchJson(json, req, result);
    const std::string body = readAll(json);
    assert(body.find("\"seed_length\": 2") != std::string::npos);
    assert(body.find("{\"query_start\":1,\"text_start\":1,\"mismatches\":1") != std::string::npos);
  }

  // Command-line integers must be whole numbers; seeds must fit 32 bits unsigned.
  {
    const char* argv[] = {"qmatch_cli", "--n", "12abc", "--k", "2", "--seed", "-1", "--verbose", "--threads", "99999999999"};
    const qmatch::Options opts = qmatch::parseArgs(10, argv);
    assert(qmatch::getOne(opts, "--verbose") == "true");
    assert(qmatch::getInt(opts, "--k", 0) == 2);
    assert(qmatch::getInt(opts, "--missing", 7) == 7);
    assert(throwsInvalidArgument([&opts] { qmatch::getInt(opts, "--n", 0); }));
    assert(throwsInvalidArgument([&opts] { qmatch::getInt(opts, "--threads", 1); }));
    assert(throwsInvalidArgument([&opts] { qmatch::requireOne(opts, "--verbose"); }));

    bool seedRejected = false;
    try {
      qmatch::getSeed(opts);
    } catch (const std::invalid_argument& e) {
      seedRejected = std::string(e.what()).find("Option --seed expects") != std::string::npos;
    }
    assert(seedRejected);

    const char* good[] = {"qmatch_cli", "--seed", "4294967295", "--p", "-3"};
    const qmatch::Options ok = qmatch::parseArgs(5, good);
    assert(qmatch::getSeed(ok) == 4294967295u);
    assert(qmatch::getInt(ok, "--p", 0) == -3);

    const char* big[] = {"qmatch_cli", "--seed", "4294967296"};
    assert(throwsInvalidArgument([&big] { qmatch::getSeed(qmatch::parseArgs(3, big)); }));
  }

  std::cout << "All tests passed\n";
  return 0;
}
