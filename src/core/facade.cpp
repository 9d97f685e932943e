#include "qmatch/facade.hpp"

#include "qmatch/dna_generator.hpp"
#include "qmatch/fasta_io.hpp"

#include <random>

namespace qmatch {

QueryMatchFacade::QueryMatchFacade() = default;

const IMatcher& QueryMatchFacade::matcherFor(MatchMethod method) const {
  if (method == MatchMethod::BruteForce) {
    return bruteMatcher_;
  }
  return lmerMatcher_;
}

MatchResult QueryMatchFacade::match(const MatchRequest& request) const {
  return matcherFor(request.method).match(request);
}

std::pair<MatchRequest, MatchResult> QueryMatchFacade::matchFasta(const FastaMatchRequest& request) const {
  MatchRequest req;
  req.query = readFastaSequence(request.queryFasta, request.querySeq);
  req.text = readFastaSequence(request.textFasta, request.textSeq);
  req.n = request.n;
  req.k = request.k;
  req.threads = request.threads;
  req.method = request.method;
  MatchResult result = match(req);
  return {std::move(req), std::move(result)};
}

std::pair<DemoCase, MatchResult> QueryMatchFacade::demo(const DemoParams& params, std::uint32_t seed) const {
  std::mt19937 rng(seed);
  DemoCase demoCase = buildDemoCase(params, rng);

  MatchRequest req;
  req.query = demoCase.query;
  req.text = demoCase.text;
  req.n = params.n;
  req.k = params.k;
  MatchResult result = match(req);
  return {std::move(demoCase), std::move(result)};
}

}  // namespace qmatch
