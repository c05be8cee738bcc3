// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_CLEANSE_H
#define HDVAULT_CLEANSE_H

#include <cstring>

void memory_cleanse(void* ptr, std::size_t len);

#endif // HDVAULT_CLEANSE_H
