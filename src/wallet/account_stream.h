// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_ACCOUNT_STREAM_H
#define HDVAULT_ACCOUNT_STREAM_H

#include "account.h"
#include "blocking_queue.h"

#include <atomic>
#include <thread>

class HDWallet;

static const size_t DEFAULT_STREAM_CAPACITY = 1024;

/**
 * Pull based enumeration of the accounts of a wallet.
 *
 * A producer thread walks the store, decodes every account record and
 * hands the accounts over through a bounded queue, so it blocks while
 * the consumer is slow. Records that fail to decode are skipped and
 * counted. A store that cannot read the records ends the stream early
 * and marks it failed. The stream must not outlive its wallet.
 */
class AccountStream {
public:
    AccountStream(const HDWallet& wallet, size_t capacity = DEFAULT_STREAM_CAPACITY);
    AccountStream(const AccountStream&) = delete;
    AccountStream& operator=(const AccountStream&) = delete;

    // cancels and joins the producer
    ~AccountStream();

    /** Blocks for the next account, false once the stream is exhausted or cancelled */
    bool Next(AccountPtr& account);

    /** Stops the producer, also when it is blocked on a full queue */
    void Cancel();

    /** Number of undecodable records passed over so far */
    size_t Skipped() const {
        return skipped_;
    }

    /** True once the store failed to read; only final after Next returned false */
    bool Failed() const {
        return failed_;
    }

    bool IsCancelled() const {
        return cancelled_;
    }

private:
    void Produce();

    const HDWallet& wallet_;
    BlockingQueue<AccountPtr> queue_;
    std::atomic<size_t> skipped_;
    std::atomic_bool cancelled_;
    std::atomic_bool failed_;
    std::thread producer_;
};

#endif // HDVAULT_ACCOUNT_STREAM_H
