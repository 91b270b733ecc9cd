/*
 * Roomcast
 * Connection failure recovery decisions
 */

#include "roomcast-recovery-policy.h"

#include <climits>

namespace roomcast
{

const char *recoveryDecisionToString(RecoveryDecision decision)
{
	switch (decision) {
	case RecoveryDecision::Retry:
		return "retry";
	case RecoveryDecision::AlreadyRetrying:
		return "already-retrying";
	case RecoveryDecision::Exhausted:
		return "exhausted";
	case RecoveryDecision::Disabled:
		return "disabled";
	}
	return "unknown";
}

bool shouldRecover(Role localRole, ConnectionState state)
{
	if (state == ConnectionState::Failed) {
		return true;
	}
	return state == ConnectionState::Disconnected && localRole == Role::Broadcaster;
}

bool shouldRecover(Role localRole, IceConnectionState state)
{
	if (state == IceConnectionState::Failed) {
		return true;
	}
	return state == IceConnectionState::Disconnected && localRole == Role::Broadcaster;
}

RecoveryDecision evaluateRecovery(const RecoveryConfig &config, int retryCount, bool isRetrying)
{
	if (!config.enabled) {
		return RecoveryDecision::Disabled;
	}
	if (isRetrying) {
		return RecoveryDecision::AlreadyRetrying;
	}
	if (retryCount >= config.maxRetryAttempts) {
		return RecoveryDecision::Exhausted;
	}
	return RecoveryDecision::Retry;
}

int backoffDelayMs(const RecoveryConfig &config, int retryCount)
{
	if (config.baseDelayMs <= 0) {
		return 0;
	}

	long long delay = config.baseDelayMs;
	for (int i = 1; i < retryCount; ++i) {
		delay *= 2;
		if (delay >= INT_MAX) {
			return INT_MAX;
		}
	}
	return static_cast<int>(delay);
}

int remainingDelayMs(int delayMs, std::chrono::steady_clock::time_point lastRetryAt,
                     std::chrono::steady_clock::time_point now)
{
	if (delayMs <= 0) {
		return 0;
	}
	// No previous attempt: restart immediately.
	if (lastRetryAt == std::chrono::steady_clock::time_point{}) {
		return 0;
	}
	if (now < lastRetryAt) {
		return delayMs;
	}

	const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastRetryAt).count();
	if (elapsed >= delayMs) {
		return 0;
	}
	return delayMs - static_cast<int>(elapsed);
}

} // namespace roomcast
