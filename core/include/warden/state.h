#pragma once

// Type-state tags for ExecutionContext.
//
// Lifecycle (linear, no skipping, no cycle):
//   Unauthenticated --authenticate--> Authenticated --authorize--> Authorized
//
// Each transition consumes the previous context and yields a new one.
// The specializations live in context.h; they are declared here so that
// capability.h can befriend the authorize transition without a cycle.

namespace warden {

struct Unauthenticated {};
struct Authenticated {};
struct Authorized {};

template <typename State>
class ExecutionContext;

template <> class ExecutionContext<Unauthenticated>;
template <> class ExecutionContext<Authenticated>;
template <> class ExecutionContext<Authorized>;

} // namespace warden
