#include "qmatch/report.hpp"

#include "qmatch/matcher.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace qmatch {

namespace {

std::string toJsonString(const std::string& raw) {
  std::string out;
  out.reserve(raw.size() + 8);
  for (char ch : raw) {
    switch (ch) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: out += ch; break;
    }
  }
  return out;
}

std::string nmerAt(const std::string& seq, int start1, int n) {
  return seq.substr(static_cast<std::size_t>(start1 - 1), static_cast<std::size_t>(n));
}

}  // namespace

std::string describeMatch(const std::string& query, const std::string& text, const MatchPair& pair, int n) {
  const int d = hammingDistance(query, pair.queryStart - 1, text, pair.textStart - 1, n);
  std::ostringstream oss;
  oss << "q[" << pair.queryStart << ":" << pair.queryStart + n << "] ~ t[" << pair.textStart << ":"
      << pair.textStart + n << "]  -> " << d << " mismatches";
  return oss.str();
}

void printMatches(std::ostream& out,
                  const std::string& query,
                  const std::string& text,
                  int n,
                  const MatchResult& result) {
  if (result.cancelled) {
    out << "Search cancelled.\n";
    return;
  }
  if (result.pairs.empty()) {
    out << "No matches found.\n";
    return;
  }
  out << "Found matches at (query_start, text_start):\n";
  for (const auto& pair : result.pairs) {
    out << "  " << describeMatch(query, text, pair, n) << "\n";
  }
}

void writeMatchTsv(const std::string& path, const MatchRequest& request, const MatchResult& result) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to write match table: " + path);
  }
  out << "query_start\ttext_start\tmismatches\tquery_kmer\ttext_kmer\n";
  for (const auto& pair : result.pairs) {
    out << pair.queryStart << '\t' << pair.textStart << '\t'
        << hammingDistance(request.query, pair.queryStart - 1, request.text, pair.textStart - 1, request.n) << '\t'
        << nmerAt(request.query, pair.queryStart, request.n) << '\t'
        << nmerAt(request.text, pair.textStart, request.n) << '\n';
  }
}

void writeMatchJson(const std::string& path, const MatchRequest& request, const MatchResult& result) {
  std::ofstream log(path);
  if (!log) {
    throw std::runtime_error("Failed to write match report: " + path);
  }
  log << "{\n";
  log << "  \"method\": \"" << toJsonString(methodName(request.method)) << "\",\n";
  log << "  \"query_length\": " << request.query.size() << ",\n";
  log << "  \"text_length\": " << request.text.size() << ",\n";
  log << "  \"n\": " << request.n << ",\n";
  log << "  \"k\": " << request.k << ",\n";
  log << "  \"seed_length\": " << result.seedLength << ",\n";
  log << "  \"threads\": " << request.threads << ",\n";
  log << "  \"cancelled\": " << (result.cancelled ? "true" : "false") << ",\n";
  log << "  \"stats\": {\"windows\":" << result.stats.windowsScanned
      << ",\"seed_hits\":" << result.stats.seedHits
      << ",\"candidates\":" << result.stats.candidates
      << ",\"out_of_bounds\":" << result.stats.outOfBounds
      << ",\"verified\":" << result.stats.verified
      << ",\"accepted\":" << result.stats.accepted << "},\n";
  log << "  \"matches\": [\n";
  for (std::size_t i = 0; i < result.pairs.size(); ++i) {
    const auto& pair = result.pairs[i];
    log << "    {\"query_start\":" << pair.queryStart
        << ",\"text_start\":" << pair.textStart
        << ",\"mismatches\":"
        << hammingDistance(request.query, pair.queryStart - 1, request.text, pair.textStart - 1, request.n)
        << ",\"query_kmer\":\"" << toJsonString(nmerAt(request.query, pair.queryStart, request.n))
        << "\",\"text_kmer\":\"" << toJsonString(nmerAt(request.text, pair.textStart, request.n)) << "\"}";
    if (i + 1 < result.pairs.size()) {
      log << ',';
    }
    log << "\n";
  }
  log << "  ]\n";
  log << "}\n";
}

}  // namespace qmatch
