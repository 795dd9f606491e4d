/**
 * Hydrolink - BLE Central Implementation
 * NimBLE client for bottle discovery, telemetry and control writes
 */

#include "ble_central.h"
#include <Arduino.h>
#include <NimBLEDevice.h>
#include "config.h"
#include "hydrolink.h"

// NimBLE's scan-complete callback is a plain function pointer
static BleCentral* g_central = nullptr;

#define BLE_DEBUG_F(fmt, ...) DEBUG_PRINTF(g_debug_ble, "[BLE] " fmt "\n", ##__VA_ARGS__)

// Advertisement callbacks
class CentralScanCallbacks : public NimBLEAdvertisedDeviceCallbacks {
    void onResult(NimBLEAdvertisedDevice* device) {
        if (g_central != nullptr) {
            g_central->handleAdvertisement(device);
        }
    }
};

// Client callbacks
class CentralClientCallbacks : public NimBLEClientCallbacks {
    void onConnect(NimBLEClient* client) {
        BLE_DEBUG_F("Link up: %s", client->getPeerAddress().toString().c_str());
        // Shorter interval while streaming telemetry
        client->updateConnParams(24, 48, 0, 400);
    }

    void onDisconnect(NimBLEClient* client) {
        BLE_DEBUG_F("Link down: %s", client->getPeerAddress().toString().c_str());
        if (g_central != nullptr) {
            g_central->handlePeerDisconnect();
        }
    }
};

static CentralScanCallbacks g_scan_callbacks;
static CentralClientCallbacks g_client_callbacks;

static void onScanEnded(NimBLEScanResults results) {
    (void)results;
    if (g_central != nullptr) {
        g_central->handleScanEnded();
    }
}

static void onTelemetryNotify(NimBLERemoteCharacteristic* characteristic, uint8_t* data,
                              size_t length, bool is_notify) {
    (void)characteristic;
    (void)is_notify;
    if (g_central != nullptr) {
        g_central->handleNotify(data, length);
    }
}

BleCentral::BleCentral()
    : m_initialized(false),
      m_listener(nullptr),
      m_scanning(false),
      m_client(nullptr),
      m_telemetry_char(nullptr),
      m_control_char(nullptr),
      m_next_link_id(1),
      m_polling(false),
      m_last_poll_ms(0),
      m_connecting(false),
      m_cancel_connect(false),
      m_peer_disconnected(false) {
}

BleCentral::~BleCentral() {
    disconnect();
    if (g_central == this) {
        g_central = nullptr;
    }
}

// Initialize BLE central
bool BleCentral::init(const char* device_name) {
    if (m_initialized) {
        return true;
    }

    BLE_DEBUG_F("Initializing central '%s'", device_name);
    g_central = this;

    NimBLEDevice::init(device_name);
    NimBLEDevice::setPower(ESP_PWR_LVL_P3);
    NimBLEDevice::setMTU(BLE_MTU_SIZE);

    NimBLEScan* scan = NimBLEDevice::getScan();
    if (scan == nullptr) {
        LOG_PRINTF("BLE: Scanner unavailable\n");
        return false;
    }
    scan->setAdvertisedDeviceCallbacks(&g_scan_callbacks, true);
    scan->setActiveScan(true);
    scan->setInterval(BLE_SCAN_INTERVAL);
    scan->setWindow(BLE_SCAN_WINDOW);

    m_initialized = true;
    BLE_DEBUG_F("Central ready");
    return true;
}

void BleCentral::setListener(TransportListener* listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_listener.store(listener);
}

// ==================== Discovery ====================

LinkError BleCentral::startScan(uint32_t timeout_ms) {
    if (!m_initialized) {
        return LinkError(ERR_RADIO_UNAVAILABLE, "BLE not initialized");
    }
    if (m_scanning.load()) {
        BLE_DEBUG_F("Already scanning, ignoring start request");
        return LinkError();
    }

    {
        std::lock_guard<std::mutex> lock(m_scan_mutex);
        m_results.clear();
    }

    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->clearResults();

    uint32_t duration_s = (timeout_ms + 999) / 1000;
    if (duration_s == 0) {
        duration_s = 1;
    }

    m_scanning.store(true);
    if (!scan->start(duration_s, onScanEnded, false)) {
        m_scanning.store(false);
        return LinkError(ERR_RADIO_UNAVAILABLE, "Scan could not be started");
    }

    BLE_DEBUG_F("Scanning for %us", (unsigned)duration_s);
    return LinkError();
}

void BleCentral::stopScan() {
    if (!m_initialized || !m_scanning.load()) {
        return;
    }
    BLE_DEBUG_F("Stopping scan");
    // Does not fire the scan-ended callback
    NimBLEDevice::getScan()->stop();
    handleScanEnded();
}

bool BleCentral::isScanning() const {
    return m_scanning.load();
}

std::vector<PeripheralHandle> BleCentral::scanResults() const {
    std::lock_guard<std::mutex> lock(m_scan_mutex);
    std::vector<PeripheralHandle> out;
    out.reserve(m_results.size());
    for (size_t i = 0; i < m_results.size(); i++) {
        out.push_back(m_results[i].peripheral);
    }
    return out;
}

void BleCentral::handleAdvertisement(NimBLEAdvertisedDevice* device) {
    if (device == nullptr || !m_scanning.load()) {
        return;
    }

    std::string name = device->haveName() ? device->getName() : std::string();
    bool has_service = device->isAdvertisingService(NimBLEUUID(HYDROLINK_SERVICE_UUID));

    if (!peripheralIsBottle(has_service, name)) {
        return;
    }

    ScanEntry entry;
    entry.peripheral = PeripheralHandle(device->getAddress().toString(), name, device->getRSSI());
    entry.address_type = device->getAddress().getType();

    {
        std::lock_guard<std::mutex> lock(m_scan_mutex);
        bool known = false;
        for (size_t i = 0; i < m_results.size(); i++) {
            if (m_results[i].peripheral.id == entry.peripheral.id) {
                m_results[i].peripheral.rssi = entry.peripheral.rssi;
                if (!name.empty()) {
                    m_results[i].peripheral.name = name;
                }
                known = true;
                break;
            }
        }
        if (!known) {
            if (m_results.size() >= BLE_MAX_SCAN_RESULTS) {
                return;
            }
            m_results.push_back(entry);
            BLE_DEBUG_F("Found %s '%s' rssi=%d%s", entry.peripheral.id.c_str(), name.c_str(),
                        entry.peripheral.rssi, has_service ? " [service]" : " [name]");
        }
    }

    std::lock_guard<std::mutex> lock(m_listener_mutex);
    TransportListener* listener = m_listener.load();
    if (listener != nullptr) {
        listener->onPeripheralFound(entry.peripheral);
    }
}

void BleCentral::handleScanEnded() {
    if (!m_scanning.exchange(false)) {
        return;
    }

    size_t found;
    {
        std::lock_guard<std::mutex> lock(m_scan_mutex);
        found = m_results.size();
    }
    BLE_DEBUG_F("Scan ended, %u bottles", (unsigned)found);

    std::lock_guard<std::mutex> lock(m_listener_mutex);
    TransportListener* listener = m_listener.load();
    if (listener != nullptr) {
        listener->onScanComplete(found);
    }
}

// ==================== Link ====================

LinkError BleCentral::connect(const std::string& peripheral_id, uint32_t timeout_ms,
                              ConnectionHandle& out) {
    if (!m_initialized) {
        return LinkError(ERR_RADIO_UNAVAILABLE, "BLE not initialized");
    }
    if (m_connecting.exchange(true)) {
        return LinkError(ERR_BUSY, "Connect already in progress");
    }

    m_cancel_connect.store(false);
    m_peer_disconnected.store(false);

    if (m_scanning.load()) {
        stopScan();
    }

    uint8_t address_type = BLE_ADDR_PUBLIC;
    {
        std::lock_guard<std::mutex> lock(m_scan_mutex);
        for (size_t i = 0; i < m_results.size(); i++) {
            if (m_results[i].peripheral.id == peripheral_id) {
                address_type = m_results[i].address_type;
                break;
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        if (m_client != nullptr) {
            releaseLink();
        }
        m_client = NimBLEDevice::createClient();
    }
    if (m_client == nullptr) {
        m_connecting.store(false);
        return LinkError(ERR_RADIO_UNAVAILABLE, "No free client slot");
    }

    m_client->setClientCallbacks(&g_client_callbacks, false);
    uint32_t timeout_s = (timeout_ms + 999) / 1000;
    m_client->setConnectTimeout(timeout_s == 0 ? 1 : (uint8_t)timeout_s);

    BLE_DEBUG_F("Connecting to %s", peripheral_id.c_str());
    bool connected = m_client->connect(NimBLEAddress(peripheral_id, address_type), true);

    LinkError err;
    if (m_cancel_connect.load()) {
        err = LinkError(ERR_CANCELLED, "Connect aborted");
    } else if (!connected) {
        err = LinkError(ERR_CONNECT_TIMEOUT, "No response from " + peripheral_id);
    } else {
        resolveCharacteristics(err);
    }

    std::lock_guard<std::mutex> lock(m_link_mutex);
    if (!err.ok()) {
        BLE_DEBUG_F("Connect failed: %s", err.message.c_str());
        releaseLink();
        m_connecting.store(false);
        return err;
    }

    m_link.link_id = m_next_link_id++;
    if (m_next_link_id == 0) {
        m_next_link_id = 1;
    }
    m_link.peripheral_id = peripheral_id;
    m_peer_disconnected.store(false);
    out = m_link;
    m_connecting.store(false);

    BLE_DEBUG_F("Connected, link %u, MTU %u", (unsigned)m_link.link_id, (unsigned)m_client->getMTU());
    return err;
}

bool BleCentral::resolveCharacteristics(LinkError& err) {
    NimBLERemoteService* service = m_client->getService(HYDROLINK_SERVICE_UUID);
    if (service == nullptr) {
        err = LinkError(ERR_SERVICE_NOT_FOUND, "Bottle service not present");
        return false;
    }

    std::vector<NimBLERemoteCharacteristic*>* chars = service->getCharacteristics(true);

    // Telemetry: known UUID, else first notifiable, else first readable
    NimBLERemoteCharacteristic* telemetry = service->getCharacteristic(HYDROLINK_TELEMETRY_CHAR_UUID);
    if (telemetry == nullptr && chars != nullptr) {
        for (size_t i = 0; i < chars->size() && telemetry == nullptr; i++) {
            if ((*chars)[i]->canNotify()) {
                telemetry = (*chars)[i];
            }
        }
        for (size_t i = 0; i < chars->size() && telemetry == nullptr; i++) {
            if ((*chars)[i]->canRead()) {
                telemetry = (*chars)[i];
            }
        }
    }
    if (telemetry == nullptr) {
        err = LinkError(ERR_CHARACTERISTIC_NOT_FOUND, "No telemetry characteristic");
        return false;
    }

    // Control: known UUID, else telemetry if writable, else first writable
    NimBLERemoteCharacteristic* control = service->getCharacteristic(HYDROLINK_CONTROL_CHAR_UUID);
    if (control == nullptr && (telemetry->canWrite() || telemetry->canWriteNoResponse())) {
        control = telemetry;
    }
    if (control == nullptr && chars != nullptr) {
        for (size_t i = 0; i < chars->size() && control == nullptr; i++) {
            if ((*chars)[i]->canWrite() || (*chars)[i]->canWriteNoResponse()) {
                control = (*chars)[i];
            }
        }
    }

    std::lock_guard<std::mutex> lock(m_link_mutex);
    m_telemetry_char = telemetry;
    m_control_char = control;
    BLE_DEBUG_F("Telemetry %s, control %s", telemetry->getUUID().toString().c_str(),
                control != nullptr ? control->getUUID().toString().c_str() : "(none)");
    return true;
}

LinkError BleCentral::subscribe(const ConnectionHandle& link) {
    std::lock_guard<std::mutex> lock(m_link_mutex);
    if (!linkMatches(link) || m_telemetry_char == nullptr) {
        return LinkError(ERR_NOT_CONNECTED, "Stale link");
    }

    if (m_telemetry_char->canNotify()) {
        if (!m_telemetry_char->subscribe(true, onTelemetryNotify, false)) {
            return LinkError(ERR_CHARACTERISTIC_NOT_FOUND, "Notification subscribe refused");
        }
        m_polling = false;
        BLE_DEBUG_F("Subscribed to notifications");
    } else {
        m_polling = true;
        m_last_poll_ms = millis();
        BLE_DEBUG_F("Telemetry not notifiable, polling every %ums", (unsigned)BLE_READ_POLL_INTERVAL_MS);
    }
    return LinkError();
}

LinkError BleCentral::write(const ConnectionHandle& link, const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(m_link_mutex);
    if (!linkMatches(link)) {
        return LinkError(ERR_NOT_CONNECTED, "Stale link");
    }
    if (m_control_char == nullptr) {
        return LinkError(ERR_WRITE_FAILED, "Bottle has no writable characteristic");
    }

    bool with_response = m_control_char->canWrite();
    if (!m_control_char->writeValue(data, length, with_response)) {
        return LinkError(ERR_WRITE_FAILED, "Write rejected");
    }
    BLE_DEBUG_F("Wrote %u bytes", (unsigned)length);
    return LinkError();
}

void BleCentral::disconnect() {
    if (m_connecting.load()) {
        // connect() owns the client until it returns; it sees the flag and cleans up
        m_cancel_connect.store(true);
        std::lock_guard<std::mutex> lock(m_link_mutex);
        if (m_client != nullptr) {
            m_client->disconnect();
        }
        return;
    }

    std::lock_guard<std::mutex> lock(m_link_mutex);
    if (m_client == nullptr) {
        return;
    }
    BLE_DEBUG_F("Disconnecting link %u", (unsigned)m_link.link_id);
    releaseLink();
}

bool BleCentral::isConnected() const {
    std::lock_guard<std::mutex> lock(m_link_mutex);
    return m_link.valid() && m_client != nullptr && m_client->isConnected();
}

// m_link_mutex must be held
void BleCentral::releaseLink() {
    if (m_telemetry_char != nullptr && !m_polling && m_client != nullptr && m_client->isConnected()) {
        m_telemetry_char->unsubscribe(false);
    }
    m_telemetry_char = nullptr;
    m_control_char = nullptr;
    m_polling = false;
    m_link = ConnectionHandle();

    if (m_client != nullptr) {
        if (m_client->isConnected()) {
            m_client->disconnect();
        }
        NimBLEDevice::deleteClient(m_client);
        m_client = nullptr;
    }
    m_peer_disconnected.store(false);
}

bool BleCentral::linkMatches(const ConnectionHandle& link) const {
    return link.valid() && link.link_id == m_link.link_id && m_client != nullptr;
}

// ==================== Callbacks ====================

void BleCentral::handleNotify(const uint8_t* data, size_t length) {
    ConnectionHandle link;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        link = m_link;
    }
    if (!link.valid()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    TransportListener* listener = m_listener.load();
    if (listener != nullptr) {
        listener->onPayload(link, data, length);
    }
}

void BleCentral::handlePeerDisconnect() {
    // Client teardown is not allowed from inside the host callback; update() does it
    m_peer_disconnected.store(true);
}

// Update BLE central (call from main loop)
void BleCentral::update(uint32_t now_ms) {
    if (!m_initialized) {
        return;
    }

    if (m_peer_disconnected.load() && !m_connecting.load()) {
        ConnectionHandle lost;
        {
            std::lock_guard<std::mutex> lock(m_link_mutex);
            lost = m_link;
            if (m_client != nullptr) {
                releaseLink();
            }
            m_peer_disconnected.store(false);
        }
        if (lost.valid()) {
            LOG_PRINTF("BLE: Bottle %s disconnected\n", lost.peripheral_id.c_str());
            std::lock_guard<std::mutex> lock(m_listener_mutex);
            TransportListener* listener = m_listener.load();
            if (listener != nullptr) {
                listener->onLinkLost(lost, "peripheral disconnected");
            }
        }
        return;
    }

    // Read-only telemetry characteristic
    ConnectionHandle link;
    std::string value;
    {
        std::lock_guard<std::mutex> lock(m_link_mutex);
        if (!m_polling || m_telemetry_char == nullptr || !m_link.valid()) {
            return;
        }
        if (now_ms - m_last_poll_ms < BLE_READ_POLL_INTERVAL_MS) {
            return;
        }
        m_last_poll_ms = now_ms;
        value = m_telemetry_char->readValue();
        link = m_link;
    }

    if (value.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    TransportListener* listener = m_listener.load();
    if (listener != nullptr) {
        listener->onPayload(link, reinterpret_cast<const uint8_t*>(value.data()), value.size());
    }
}
