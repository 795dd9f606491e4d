// serial_commands.h
// Serial command console for driving the hub over USB
// Part of the Hydrolink hub firmware

#ifndef SERIAL_COMMANDS_H
#define SERIAL_COMMANDS_H

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include <Arduino.h>

class SessionCoordinator;

// Initialize serial command handler
// Must be called once in setup() after Serial.begin() and after the
// session coordinator has been constructed
void serialCommandsInit(SessionCoordinator* session);

// Update serial command handler (call in loop())
// Checks for incoming serial data and processes commands
void serialCommandsUpdate();

// True once SHUTDOWN has been entered; main loop stops driving the session
bool serialCommandsShutdownRequested();

#endif // ENABLE_SERIAL_COMMANDS

#endif // SERIAL_COMMANDS_H
