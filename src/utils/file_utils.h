// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_FILE_UTILS_H
#define HDVAULT_FILE_UTILS_H

#include <optional>
#include <string>
#include <vector>

bool CheckDirExist(const std::string& dirPath);
bool CheckFileExist(const std::string& filePath);
bool MkdirRecursive(const std::string& path);
void DeleteDir(const std::string& dirpath);

/** Whole-file binary reads and writes used by export and import */
std::optional<std::vector<unsigned char>> ReadBinaryFile(const std::string& filePath);
bool WriteBinaryFile(const std::string& filePath, const std::vector<unsigned char>& data);

#endif // HDVAULT_FILE_UTILS_H
