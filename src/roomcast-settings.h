/*
 * Roomcast
 * Settings loading through obs_data
 */

#pragma once

#include <string>

#include <obs-data.h>

#include "roomcast-common.h"

namespace roomcast
{

void roomcastSettingsDefaults(obs_data_t *settings);

// Reads an obs_data object into OrchestratorSettings. TURN keys can be
// overridden by ROOMCAST_TURN_SERVER_URL, ROOMCAST_TURN_USERNAME and
// ROOMCAST_TURN_CREDENTIAL. Throws RoomcastError(InvalidSettings).
OrchestratorSettings settingsFromData(obs_data_t *settings);

OrchestratorSettings loadSettingsJson(const std::string &json);
OrchestratorSettings loadSettingsFile(const std::string &path);

} // namespace roomcast
