// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hv/json.hpp"

namespace printcast {

/**
 * @brief A printer that answered a discovery probe
 */
struct DiscoveredPrinter {
    std::string address; ///< IPv4 address the reply came from
    std::string name;    ///< Display name ("Name" or "MachineName"), may be empty
    std::string id;      ///< MainboardID, may be empty
    bool is_proxy = false;

    /// Name for logs and the status model: name, else id, else a generic label
    std::string display_name() const {
        if (!name.empty()) {
            return name;
        }
        if (!id.empty()) {
            return id;
        }
        return "Elegoo Printer";
    }

    bool operator==(const DiscoveredPrinter& other) const {
        return address == other.address;
    }
};

/**
 * @brief Parse one SDCP discovery reply
 *
 * The proxy flag may sit in Data.Attributes.Proxy, Attributes.Proxy or Data.Proxy.
 */
DiscoveredPrinter parse_discovery_reply(const nlohmann::json& reply, const std::string& from_ip);

/// Drop proxies, keeping discovery order
std::vector<DiscoveredPrinter> filter_proxies(const std::vector<DiscoveredPrinter>& printers);

/**
 * @brief Abstract LAN discovery
 *
 * Allows dependency injection of mock implementations for testing.
 */
class IPrinterDiscovery {
  public:
    using DiscoveryCallback = std::function<void(const std::vector<DiscoveredPrinter>&)>;

    virtual ~IPrinterDiscovery() = default;

    /**
     * @brief Probe the LAN for @p timeout_ms, then report every responder once
     *
     * The callback may run on a background thread. A new discover() call
     * while one is running replaces the pending callback.
     */
    virtual void discover(uint32_t timeout_ms, DiscoveryCallback on_done) = 0;

    /// Abort a running probe; its callback is not invoked
    virtual void cancel() = 0;
};

/**
 * @brief SDCP UDP broadcast discovery
 *
 * Broadcasts "M99999" to port 3000 and collects the JSON replies until the
 * timeout. Runs on a background thread; cancel() blocks until it exits.
 */
class UdpPrinterDiscovery : public IPrinterDiscovery {
  public:
    static constexpr uint16_t DISCOVERY_PORT = 3000;
    static constexpr const char* PROBE_MESSAGE = "M99999";

    UdpPrinterDiscovery();
    ~UdpPrinterDiscovery() override;

    UdpPrinterDiscovery(const UdpPrinterDiscovery&) = delete;
    UdpPrinterDiscovery& operator=(const UdpPrinterDiscovery&) = delete;

    void discover(uint32_t timeout_ms, DiscoveryCallback on_done) override;
    /// Returns at once; the cancelled probe thread is joined by a later discover()
    void cancel() override;

    /// Cancelled or finished probe threads not yet joined
    size_t unreaped_threads() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace printcast
