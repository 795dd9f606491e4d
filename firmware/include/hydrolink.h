/**
 * Hydrolink - Smart Bottle Link Hub
 * Common definitions and identifiers
 */

#ifndef HYDROLINK_H
#define HYDROLINK_H

// Version info
#define HYDROLINK_VERSION_MAJOR  0
#define HYDROLINK_VERSION_MINOR  3
#define HYDROLINK_VERSION_PATCH  0
#define HYDROLINK_VERSION        "0.3.0"

// Hub identity (advertised name when the radio is initialised)
#define HYDROLINK_HUB_NAME              "Hydrolink-Hub"

// Smart bottle peripheral identity
// Name is used as a discovery fallback when the service UUID is not advertised
#define HYDROLINK_BOTTLE_NAME           "SmartWaterBottle"
#define HYDROLINK_SERVICE_UUID          "4fafc201-1fb5-459e-8fcc-c5c9c331914b"
#define HYDROLINK_TELEMETRY_CHAR_UUID   "beb5483e-36e1-4688-b7f5-ea07361b26a8"
#define HYDROLINK_CONTROL_CHAR_UUID     "beb5483e-36e1-4688-b7f5-ea07361b26a9"

// Subject used when nobody has been selected from the console
#define HYDROLINK_DEFAULT_SUBJECT       "self"

#endif // HYDROLINK_H
