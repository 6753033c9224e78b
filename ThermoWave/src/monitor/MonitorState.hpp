#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include "MonitorSnapshot.h"
/* MONITORSTATE
--> single place the poll loop (writer) publishes the latest snapshot and the
    http thread (reader) copies it out. seq bumps on every publish so a client
    can tell a stale answer from a fresh one.
*/

struct MonitorState_s {
    std::atomic<int> g_seq{0};
    std::atomic<bool> g_has_log{false};

    // snapshot is a custom type -> mutex protection
    mutable std::mutex snapshot_mtx;
    monitorSnapshot_S g_snapshot;

    monitorSnapshot_S get_snapshot() const {
        std::lock_guard<std::mutex> lock(snapshot_mtx);
        return g_snapshot; // copy
    }

    void publish(const monitorSnapshot_S& snap) {
        {
            std::lock_guard<std::mutex> lock(snapshot_mtx);
            g_snapshot = snap;
        }
        g_has_log.store(true, std::memory_order_release);
        g_seq.fetch_add(1, std::memory_order_acq_rel);
    }
}; // MonitorState_s
