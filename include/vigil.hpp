#pragma once

/*
===============================================================================
vigil: Public API Entry Point
===============================================================================

In-process liveness supervision:

  - vigil::LivenessCheck   capability interface (name / reset / expired)
  - vigil::TimedCheck      fixed-window check on the steady clock
  - vigil::Registry        thread-safe set of named checks
  - vigil::Supervisor      periodic, fail-fast, cancellable watch loop
  - vigil::config          JSON supervision config

Every fallible operation returns a vigil::Status.
===============================================================================
*/

#include <vigil/error.hpp>
#include <vigil/liveness_check.hpp>
#include <vigil/timed_check.hpp>
#include <vigil/registry.hpp>
#include <vigil/supervisor.hpp>
#include <vigil/config.hpp>
