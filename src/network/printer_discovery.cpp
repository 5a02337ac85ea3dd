// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_discovery.h"

#include "json_utils.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <list>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace printcast {

namespace {

// Receive slice; bounds how long a cancelled probe keeps running
constexpr int RECV_SLICE_MS = 200;

bool proxy_flag(const json& obj) {
    return obj.is_object() && json_util::safe_bool(obj, "Proxy");
}

} // namespace

DiscoveredPrinter parse_discovery_reply(const json& reply, const std::string& from_ip) {
    DiscoveredPrinter printer;
    printer.address = from_ip;

    const json* data = (reply.contains("Data") && reply["Data"].is_object()) ? &reply["Data"] : nullptr;
    if (data) {
        printer.name = json_util::safe_string(*data, "Name");
        if (printer.name.empty()) {
            printer.name = json_util::safe_string(*data, "MachineName");
        }
        printer.id = json_util::safe_string(*data, "MainboardID");
        std::string ip = json_util::safe_string(*data, "MainboardIP");
        if (!ip.empty()) {
            printer.address = ip;
        }
        printer.is_proxy = proxy_flag(*data) ||
                           (data->contains("Attributes") && proxy_flag((*data)["Attributes"]));
    }
    if (printer.id.empty()) {
        printer.id = json_util::safe_string(reply, "Id");
    }
    if (reply.contains("Attributes")) {
        printer.is_proxy = printer.is_proxy || proxy_flag(reply["Attributes"]);
    }
    return printer;
}

std::vector<DiscoveredPrinter> filter_proxies(const std::vector<DiscoveredPrinter>& printers) {
    std::vector<DiscoveredPrinter> out;
    for (const auto& p : printers) {
        if (p.is_proxy) {
            spdlog::debug("[Discovery] Skipping proxy at {}", p.address);
            continue;
        }
        out.push_back(p);
    }
    return out;
}

class UdpPrinterDiscovery::Impl {
  public:
    ~Impl() {
        cancel();
        // Shutdown only; each probe exits within one receive slice
        for (auto& probe : retired_) {
            if (probe.thread.joinable()) {
                probe.thread.join();
            }
        }
    }

    void start(uint32_t timeout_ms, DiscoveryCallback callback) {
        cancel();
        reap_finished();

        auto run = std::make_shared<ProbeRun>();
        current_.run = run;
        current_.thread = std::thread(&Impl::probe, run, timeout_ms, std::move(callback));
    }

    // Signals the probe and hands its thread to the reaper; never waits for it
    void cancel() {
        if (!current_.run) {
            return;
        }
        current_.run->running.store(false);
        retired_.push_back(std::move(current_));
        current_ = ProbeThread{};
    }

    size_t unreaped_threads() const {
        return retired_.size();
    }

  private:
    struct ProbeRun {
        std::atomic<bool> running{true};
        std::atomic<bool> done{false};
    };

    struct ProbeThread {
        std::thread thread;
        std::shared_ptr<ProbeRun> run;
    };

    void reap_finished() {
        for (auto it = retired_.begin(); it != retired_.end();) {
            if (it->run->done.load() && it->thread.joinable()) {
                it->thread.join();
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    static void probe(std::shared_ptr<ProbeRun> run, uint32_t timeout_ms,
                      DiscoveryCallback callback) {
        collect(*run, timeout_ms, callback);
        run->done.store(true);
    }

    static void collect(ProbeRun& run, uint32_t timeout_ms, const DiscoveryCallback& callback) {
        std::vector<DiscoveredPrinter> found;

        int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (sock < 0) {
            spdlog::error("[Discovery] socket() failed: {}", std::strerror(errno));
            finish(run, callback, found);
            return;
        }

        int enable = 1;
        setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable));
        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = RECV_SLICE_MS * 1000;
        setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        sockaddr_in dest{};
        dest.sin_family = AF_INET;
        dest.sin_port = htons(DISCOVERY_PORT);
        dest.sin_addr.s_addr = htonl(INADDR_BROADCAST);

        ssize_t sent = ::sendto(sock, PROBE_MESSAGE, std::strlen(PROBE_MESSAGE), 0,
                                reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
        if (sent < 0) {
            spdlog::warn("[Discovery] Broadcast probe failed: {}", std::strerror(errno));
        } else {
            spdlog::debug("[Discovery] Probe sent, listening for {}ms", timeout_ms);
        }

        auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        char buf[4096];

        while (sent >= 0 && run.running.load() && std::chrono::steady_clock::now() < deadline) {
            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            ssize_t n = ::recvfrom(sock, buf, sizeof(buf) - 1, 0,
                                   reinterpret_cast<sockaddr*>(&from), &from_len);
            if (n <= 0) {
                continue; // receive slice elapsed
            }

            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));

            json reply;
            try {
                reply = json::parse(std::string(buf, static_cast<size_t>(n)));
            } catch (const json::parse_error& e) {
                spdlog::trace("[Discovery] Ignoring non-JSON reply from {}: {}", ip, e.what());
                continue;
            }

            DiscoveredPrinter printer = parse_discovery_reply(reply, ip);
            bool duplicate = false;
            for (const auto& existing : found) {
                duplicate = duplicate || existing == printer;
            }
            if (!duplicate) {
                spdlog::info("[Discovery] Found '{}' at {}{}", printer.display_name(),
                             printer.address, printer.is_proxy ? " (proxy)" : "");
                found.push_back(printer);
            }
        }

        ::close(sock);
        finish(run, callback, found);
    }

    static void finish(ProbeRun& run, const DiscoveryCallback& callback,
                       const std::vector<DiscoveredPrinter>& found) {
        if (!run.running.exchange(false)) {
            return; // cancelled
        }
        if (callback) {
            callback(found);
        }
    }

    ProbeThread current_;
    std::list<ProbeThread> retired_;
};

UdpPrinterDiscovery::UdpPrinterDiscovery() : impl_(std::make_unique<Impl>()) {}

UdpPrinterDiscovery::~UdpPrinterDiscovery() = default;

void UdpPrinterDiscovery::discover(uint32_t timeout_ms, DiscoveryCallback on_done) {
    impl_->start(timeout_ms, std::move(on_done));
}

void UdpPrinterDiscovery::cancel() {
    impl_->cancel();
}

size_t UdpPrinterDiscovery::unreaped_threads() const {
    return impl_->unreaped_threads();
}

} // namespace printcast
