/**
 * Hydrolink - Transport Adapter Interface
 * Abstract connected byte stream with structured writes
 *
 * The session coordinator only talks to the radio through this interface.
 * BleCentral (ble_central.h) implements it on NimBLE; tests script a fake.
 */

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "types.h"

// Identifies one established link. A handle from an earlier link is stale and
// every operation on it fails with ERR_NOT_CONNECTED.
struct ConnectionHandle {
    uint32_t link_id;           // 0 = no link
    std::string peripheral_id;

    ConnectionHandle() : link_id(0) {}
    bool valid() const { return link_id != 0; }
};

// Events pushed by the adapter. Called from the radio stack's context:
// implementations must not block.
class TransportListener {
public:
    virtual ~TransportListener() {}

    // New or updated discovery result during a scan
    virtual void onPeripheralFound(const PeripheralHandle& peripheral) = 0;

    // Scan window closed (timeout or stopScan)
    virtual void onScanComplete(size_t found) = 0;

    // One notification (or polled read) payload
    virtual void onPayload(const ConnectionHandle& link, const uint8_t* data, size_t length) = 0;

    // Peripheral-initiated disconnect. Only reported after the adapter has
    // released its client handle and characteristic references. Caller-initiated
    // disconnect() does not raise this.
    virtual void onLinkLost(const ConnectionHandle& link, const std::string& reason) = 0;
};

class BottleTransport {
public:
    virtual ~BottleTransport() {}

    virtual void setListener(TransportListener* listener) = 0;

    // Start a bounded discovery window (non-blocking)
    // Idempotent: while a scan runs this returns ERR_NONE and keeps the
    // in-progress result set
    virtual LinkError startScan(uint32_t timeout_ms) = 0;

    // End discovery early and release the scan resource
    virtual void stopScan() = 0;

    virtual bool isScanning() const = 0;

    // Results of the current (or last) scan session
    virtual std::vector<PeripheralHandle> scanResults() const = 0;

    // Establish a link and resolve the bottle's characteristics (blocking,
    // bounded by timeout_ms). On failure no link is left half-open.
    virtual LinkError connect(const std::string& peripheral_id, uint32_t timeout_ms,
                              ConnectionHandle& out) = 0;

    // Start telemetry delivery on an established link
    virtual LinkError subscribe(const ConnectionHandle& link) = 0;

    // Write to the control characteristic
    virtual LinkError write(const ConnectionHandle& link, const uint8_t* data, size_t length) = 0;

    // Tear down the link (or abort a connect in progress). Safe in any state.
    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    // Periodic housekeeping from the application loop
    virtual void update(uint32_t now_ms) = 0;
};

#endif // TRANSPORT_H
