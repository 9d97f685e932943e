#include "qmatch/dna_generator.hpp"
#include "qmatch/facade.hpp"
#include "qmatch/fasta_io.hpp"
#include "qmatch/options.hpp"
#include "qmatch/report.hpp"

#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>

using qmatch::DemoParams;
using qmatch::FastaMatchRequest;
using qmatch::MatchRequest;
using qmatch::MatchResult;
using qmatch::Options;
using qmatch::getInt;
using qmatch::getOne;
using qmatch::requireOne;
using qmatch::QueryMatchFacade;

namespace {

void printUsage() {
  std::cout << "qmatch_cli --cmd <match|demo|generate> [options]\n"
            << "  match: (--query SEQ | --query-fasta F [--query-seq NAME])\n"
            << "         (--text SEQ | --text-fasta F [--text-seq NAME])\n"
            << "         --n N --k K [--threads 1] [--method lmer|brute] [--tsv F] [--json F] [--verbose]\n"
            << "  demo: [--m 200] [--p 60] [--n 15] [--k 2] [--seed S]\n"
            << "  generate: --length L --output F [--name seq] [--seed S]\n";
}

void printStats(const MatchRequest& req, const MatchResult& r) {
  std::cerr << "Config: query_len=" << req.query.size() << " text_len=" << req.text.size() << " n=" << req.n
            << " k=" << req.k << " seed_len=" << r.seedLength << " method=" << qmatch::methodName(req.method)
            << " threads=" << req.threads << "\n";
  std::cerr << "Stats: windows=" << r.stats.windowsScanned << " seed_hits=" << r.stats.seedHits
            << " candidates=" << r.stats.candidates << " out_of_bounds=" << r.stats.outOfBounds
            << " verified=" << r.stats.verified << " accepted=" << r.stats.accepted
            << " unique=" << r.pairs.size() << "\n";
}

int runMatch(const QueryMatchFacade& facade, const Options& opts) {
  MatchRequest req;
  MatchResult result;
  const int n = getInt(opts, "--n", 0);
  const int k = getInt(opts, "--k", 0);
  const int threads = getInt(opts, "--threads", 1);
  const auto method = qmatch::parseMethod(getOne(opts, "--method", "lmer"));

  const std::string queryFasta = getOne(opts, "--query-fasta");
  const std::string textFasta = getOne(opts, "--text-fasta");
  if (!queryFasta.empty() && !textFasta.empty()) {
    FastaMatchRequest freq;
    freq.queryFasta = queryFasta;
    freq.querySeq = getOne(opts, "--query-seq");
    freq.textFasta = textFasta;
    freq.textSeq = getOne(opts, "--text-seq");
    freq.n = n;
    freq.k = k;
    freq.threads = threads;
    freq.method = method;
    std::tie(req, result) = facade.matchFasta(freq);
  } else {
    req.query = queryFasta.empty() ? requireOne(opts, "--query")
                                   : qmatch::readFastaSequence(queryFasta, getOne(opts, "--query-seq"));
    req.text = textFasta.empty() ? requireOne(opts, "--text")
                                 : qmatch::readFastaSequence(textFasta, getOne(opts, "--text-seq"));
    req.n = n;
    req.k = k;
    req.threads = threads;
    req.method = method;
    result = facade.match(req);
  }

  if (getOne(opts, "--verbose") == "true") {
    printStats(req, result);
  }
  qmatch::printMatches(std::cout, req.query, req.text, req.n, result);

  const std::string tsv = getOne(opts, "--tsv");
  if (!tsv.empty()) {
    qmatch::writeMatchTsv(tsv, req, result);
    std::cout << "TSV: " << tsv << "\n";
  }
  const std::string json = getOne(opts, "--json");
  if (!json.empty()) {
    qmatch::writeMatchJson(json, req, result);
    std::cout << "JSON: " << json << "\n";
  }
  return 0;
}

int runDemo(const QueryMatchFacade& facade, const Options& opts) {
  DemoParams params;
  params.m = getInt(opts, "--m", params.m);
  params.p = getInt(opts, "--p", params.p);
  params.n = getInt(opts, "--n", params.n);
  params.k = getInt(opts, "--k", params.k);
  const std::uint32_t seed = qmatch::getSeed(opts);

  auto [demo, result] = facade.demo(params, seed);
  std::cout << "Seed: " << seed << "\n";
  std::cout << "Text (len=" << demo.text.size() << "): " << demo.text << "\n";
  std::cout << "Query (len=" << demo.query.size() << "): " << demo.query << "\n";
  std::cout << "Embedded: q[" << demo.queryEmbedStart << "] ~ t[" << demo.textEmbedStart << "]\n";
  std::cout << "Searching for all " << params.n << "-mers in query vs. text with <=" << params.k
            << " mismatches...\n\n";
  qmatch::printMatches(std::cout, demo.query, demo.text, params.n, result);
  return 0;
}

int runGenerate(const Options& opts) {
  const int length = getInt(opts, "--length", -1);
  if (length < 0) {
    throw std::invalid_argument("Missing required option --length");
  }
  const std::string output = requireOne(opts, "--output");
  const std::uint32_t seed = qmatch::getSeed(opts);
  std::mt19937 rng(seed);
  qmatch::writeFasta(output, {{getOne(opts, "--name", "random"), qmatch::randomDna(length, rng)}});
  std::cout << "Output FASTA: " << output << "\n";
  std::cout << "Seed: " << seed << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  const auto opts = qmatch::parseArgs(argc, argv);
  const std::string cmd = getOne(opts, "--cmd");
  if (cmd.empty() || getOne(opts, "--help") == "true") {
    printUsage();
    return cmd.empty() ? 2 : 0;
  }

  QueryMatchFacade facade;
  try {
    if (cmd == "match") {
      return runMatch(facade, opts);
    }
    if (cmd == "demo") {
      return runDemo(facade, opts);
    }
    if (cmd == "generate") {
      return runGenerate(opts);
    }
    printUsage();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
