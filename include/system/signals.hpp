#pragma once

#include <atomic>

namespace cursorup {

// Set by SIGINT/SIGTERM; polled by long-running steps.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }
inline void ResetCancel() { g_cancel.store(false, std::memory_order_relaxed); }

} // namespace cursorup
