#include "qmatch/options.hpp"

#include <limits>
#include <random>
#include <stdexcept>

namespace qmatch {

namespace {

long long parseInteger(const std::string& key, const std::string& raw, const char* expected) {
  std::size_t pos = 0;
  long long value = 0;
  try {
    value = std::stoll(raw, &pos);
  } catch (const std::exception&) {
    pos = 0;
  }
  if (pos == 0 || pos != raw.size()) {
    throw std::invalid_argument("Option " + key + " expects " + expected + ", got '" + raw + "'");
  }
  return value;
}

}  // namespace

Options parseArgs(int argc, const char* const argv[]) {
  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string key = argv[i];
    if (key.rfind("--", 0) != 0) {
      continue;
    }
    if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
      opts[key].push_back(argv[++i]);
    } else {
      opts[key].push_back("true");
    }
  }
  return opts;
}

std::string getOne(const Options& opts, const std::string& key, const std::string& def) {
  auto it = opts.find(key);
  if (it == opts.end() || it->second.empty()) {
    return def;
  }
  return it->second.back();
}

std::string requireOne(const Options& opts, const std::string& key) {
  const std::string v = getOne(opts, key);
  if (v.empty() || v == "true") {
    throw std::invalid_argument("Missing required option " + key);
  }
  return v;
}

int getInt(const Options& opts, const std::string& key, int def) {
  const std::string raw = getOne(opts, key);
  if (raw.empty()) {
    return def;
  }
  const long long value = parseInteger(key, raw, "an integer");
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("Option " + key + " is out of range: '" + raw + "'");
  }
  return static_cast<int>(value);
}

std::uint32_t getSeed(const Options& opts) {
  const std::string raw = getOne(opts, "--seed");
  if (raw.empty()) {
    return std::random_device{}();
  }
  const long long value = parseInteger("--seed", raw, "a non-negative integer");
  if (value < 0 || value > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
    throw std::invalid_argument("Option --seed expects a non-negative integer below 2^32, got '" + raw + "'");
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace qmatch
