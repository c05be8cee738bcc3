// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "file_utils.h"
#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <sys/types.h>

bool CheckDirExist(const std::string& dirPath) {
    struct stat info;
    if (stat(dirPath.c_str(), &info) != 0)
        return false;
    return info.st_mode & S_IFDIR;
}

bool CheckFileExist(const std::string& filePath) {
    std::ifstream f(filePath.c_str());
    return f.good();
}

// used c like way to implement this
bool MkdirRecursive(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    char pathArray[1024];
    errno = 0;
    if (path.length() > sizeof(pathArray) - 1) {
        errno = ENAMETOOLONG;
        return false;
    }
    snprintf(pathArray, sizeof(pathArray), "%s", path.c_str());
    size_t len = strlen(pathArray);

    if (pathArray[len - 1] == '/')
        pathArray[len - 1] = 0;
    for (char* p = pathArray; *p; p++)
        if (*p == '/' && p != pathArray) {
            *p = 0;
            if (mkdir(pathArray, S_IRWXU) != 0) {
                if (errno != EEXIST)
                    return false;
            }
            *p = '/';
        }
    if (mkdir(pathArray, S_IRWXU) != 0) {
        if (errno != EEXIST)
            return false;
    }
    return true;
}

void DeleteDir(const std::string& dirpath) {
    if (!CheckDirExist(dirpath)) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(dirpath, ec);
    if (ec) {
        spdlog::warn("Failed to delete {}: {}", dirpath, ec.message());
    }
}

std::optional<std::vector<unsigned char>> ReadBinaryFile(const std::string& filePath) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in.good()) {
        return {};
    }
    std::vector<unsigned char> data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return {};
    }
    return data;
}

bool WriteBinaryFile(const std::string& filePath, const std::vector<unsigned char>& data) {
    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return out.good();
}
