#pragma once

#include <cstdint>

namespace Lockstep {

/// Run defaults
/// Number of orchestrator ticks when neither the document nor the CLI sets one.
inline constexpr int64_t kDefaultMaxSteps = 20;
/// Base seed for delegates and models that do not carry their own.
inline constexpr uint64_t kDefaultSeed = 0;
/// Proposal collection runs inline below two workers.
inline constexpr int kDefaultProposalWorkers = 1;
/// Zero disables the per-call delegate deadline.
inline constexpr int64_t kDefaultDelegateTimeoutMs = 0;

/// Key of the action a non-committed agent receives when its delegate needs one.
inline constexpr char kHoldActionKey[] = "hold";

/// Channel a simulator falls back to when an agent has no dedicated fading override.
inline constexpr char kDefaultChannelId[] = "default";

}  // namespace Lockstep
