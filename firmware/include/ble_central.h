/**
 * Hydrolink - BLE Central
 * NimBLE client that finds, connects to and talks with smart bottles
 */

#ifndef BLE_CENTRAL_H
#define BLE_CENTRAL_H

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include "transport.h"

class NimBLEClient;
class NimBLERemoteCharacteristic;
class NimBLEAdvertisedDevice;

class BleCentral : public BottleTransport {
public:
    BleCentral();
    ~BleCentral();

    // Initialize NimBLE as a central. Must succeed before any other call,
    // otherwise every operation fails with ERR_RADIO_UNAVAILABLE.
    bool init(const char* device_name);
    bool isInitialized() const { return m_initialized; }

    // BottleTransport
    void setListener(TransportListener* listener) override;
    LinkError startScan(uint32_t timeout_ms) override;
    void stopScan() override;
    bool isScanning() const override;
    std::vector<PeripheralHandle> scanResults() const override;
    LinkError connect(const std::string& peripheral_id, uint32_t timeout_ms,
                      ConnectionHandle& out) override;
    LinkError subscribe(const ConnectionHandle& link) override;
    LinkError write(const ConnectionHandle& link, const uint8_t* data, size_t length) override;
    void disconnect() override;
    bool isConnected() const override;
    void update(uint32_t now_ms) override;

    // NimBLE callback entry points (host task)
    void handleAdvertisement(NimBLEAdvertisedDevice* device);
    void handleScanEnded();
    void handleNotify(const uint8_t* data, size_t length);
    void handlePeerDisconnect();

private:
    struct ScanEntry {
        PeripheralHandle peripheral;
        uint8_t address_type;
    };

    bool resolveCharacteristics(LinkError& err);
    void releaseLink();
    bool linkMatches(const ConnectionHandle& link) const;

    bool m_initialized;

    // Held while a callback is delivered, so setListener() waits for it
    std::mutex m_listener_mutex;
    std::atomic<TransportListener*> m_listener;

    // Scan results (written from the host task)
    mutable std::mutex m_scan_mutex;
    std::vector<ScanEntry> m_results;
    std::atomic<bool> m_scanning;

    // Link (one bottle at a time)
    mutable std::mutex m_link_mutex;
    NimBLEClient* m_client;
    NimBLERemoteCharacteristic* m_telemetry_char;
    NimBLERemoteCharacteristic* m_control_char;
    ConnectionHandle m_link;
    uint32_t m_next_link_id;
    bool m_polling;                 // Telemetry is read-only: poll from update()
    uint32_t m_last_poll_ms;

    std::atomic<bool> m_connecting;
    std::atomic<bool> m_cancel_connect;
    std::atomic<bool> m_peer_disconnected;
};

#endif // BLE_CENTRAL_H
