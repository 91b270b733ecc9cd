/*
 * Roomcast
 * Connection failure recovery decisions
 */

#pragma once

#include <chrono>

#include "roomcast-common.h"

namespace roomcast
{

struct RecoveryConfig {
	bool enabled = true;
	int maxRetryAttempts = DEFAULT_MAX_RETRY_ATTEMPTS;
	int baseDelayMs = DEFAULT_RETRY_BASE_DELAY_MS;
};

enum class RecoveryDecision { Retry, AlreadyRetrying, Exhausted, Disabled };

const char *recoveryDecisionToString(RecoveryDecision decision);

// Whether an observed state should trigger recovery for a peer. Failed always
// does; Disconnected only when observed by the broadcaster.
bool shouldRecover(Role localRole, ConnectionState state);
bool shouldRecover(Role localRole, IceConnectionState state);

RecoveryDecision evaluateRecovery(const RecoveryConfig &config, int retryCount, bool isRetrying);

// base * 2^(retryCount - 1), saturating.
int backoffDelayMs(const RecoveryConfig &config, int retryCount);

// Portion of the backoff still to wait given the time of the previous attempt.
int remainingDelayMs(int delayMs, std::chrono::steady_clock::time_point lastRetryAt,
                     std::chrono::steady_clock::time_point now);

} // namespace roomcast
