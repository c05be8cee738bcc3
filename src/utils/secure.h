// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_SECURE_H
#define HDVAULT_SECURE_H

#include "cleanse.h"

#include <memory>
#include <string>
#include <vector>

/*
 * Allocator that wipes its contents before handing the memory back.
 * Used for seeds, private keys and passphrases.
 */
template <typename T>
struct secure_allocator : public std::allocator<T> {
    typedef std::allocator<T> base;
    typedef typename base::size_type size_type;
    typedef typename base::value_type value_type;

    secure_allocator() noexcept {}
    secure_allocator(const secure_allocator& a) noexcept : base(a) {}
    template <typename U>
    secure_allocator(const secure_allocator<U>& a) noexcept : base(a) {}
    ~secure_allocator() noexcept {}

    template <typename _Other>
    struct rebind {
        typedef secure_allocator<_Other> other;
    };

    T* allocate(std::size_t n) {
        return base::allocate(n);
    }

    void deallocate(T* p, std::size_t n) {
        if (p != nullptr) {
            memory_cleanse(p, sizeof(T) * n);
        }
        base::deallocate(p, n);
    }
};

template <typename T, typename U>
bool operator==(const secure_allocator<T>&, const secure_allocator<U>&) noexcept {
    return true;
}

template <typename T, typename U>
bool operator!=(const secure_allocator<T>&, const secure_allocator<U>&) noexcept {
    return false;
}

using SecureString = std::basic_string<char, std::char_traits<char>, secure_allocator<char>>;
using SecureByte   = std::vector<unsigned char, secure_allocator<unsigned char>>;

#endif // HDVAULT_SECURE_H
