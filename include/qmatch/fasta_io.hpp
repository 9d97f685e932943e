#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace qmatch {

using FastaMap = std::unordered_map<std::string, std::string>;

FastaMap readFasta(const std::string& path);
std::vector<std::string> readFastaNames(const std::string& path);
std::string readFastaSequence(const std::string& path, const std::string& seqName);  // empty name: first record
void writeFasta(const std::string& path, const FastaMap& records);

}  // namespace qmatch
