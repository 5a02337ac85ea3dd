// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_PRINTER_DISCOVERY_H
#define MOCK_PRINTER_DISCOVERY_H

/**
 * @file mock_printer_discovery.h
 * @brief Printer discovery that finds a configured list without network I/O
 *
 * By default discover() answers synchronously with the configured printers.
 * With respond_immediately = false the callback is held until complete().
 */

#include "printer_discovery.h"

#include <vector>

using namespace printcast;

class MockPrinterDiscovery : public IPrinterDiscovery {
  public:
    MockPrinterDiscovery() = default;
    ~MockPrinterDiscovery() override = default;

    // Non-copyable
    MockPrinterDiscovery(const MockPrinterDiscovery&) = delete;
    MockPrinterDiscovery& operator=(const MockPrinterDiscovery&) = delete;

    void discover(uint32_t timeout_ms, DiscoveryCallback on_done) override {
        ++discover_calls;
        last_timeout_ms = timeout_ms;
        if (respond_immediately) {
            on_done(printers);
            return;
        }
        pending_ = std::move(on_done);
    }

    void cancel() override {
        ++cancel_calls;
        pending_ = nullptr;
    }

    /// Answer a held discover() with the current printer list
    bool complete() {
        if (!pending_) {
            return false;
        }
        auto cb = std::move(pending_);
        pending_ = nullptr;
        cb(printers);
        return true;
    }

    void add_printer(const std::string& address, const std::string& name = "",
                     bool is_proxy = false) {
        DiscoveredPrinter p;
        p.address = address;
        p.name = name;
        p.is_proxy = is_proxy;
        printers.push_back(p);
    }

    std::vector<DiscoveredPrinter> printers;
    bool respond_immediately = true;
    int discover_calls = 0;
    int cancel_calls = 0;
    uint32_t last_timeout_ms = 0;

  private:
    DiscoveryCallback pending_;
};

#endif // MOCK_PRINTER_DISCOVERY_H
