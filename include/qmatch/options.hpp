#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace qmatch {

// `--key value` pairs from the command line; a flag without a value maps to "true".
using Options = std::unordered_map<std::string, std::vector<std::string>>;

Options parseArgs(int argc, const char* const argv[]);

std::string getOne(const Options& opts, const std::string& key, const std::string& def = "");
std::string requireOne(const Options& opts, const std::string& key);

// The whole value must be a decimal integer; trailing text is an error.
int getInt(const Options& opts, const std::string& key, int def);

// Value of --seed, or a fresh random_device draw when absent.
std::uint32_t getSeed(const Options& opts);

}  // namespace qmatch
