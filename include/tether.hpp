#pragma once

// Umbrella header

#include "tether/core/backoff.hpp"
#include "tether/core/close_code.hpp"
#include "tether/core/config.hpp"
#include "tether/core/error.hpp"
#include "tether/core/supervisor.hpp"
#include "tether/core/timer/scheduler.hpp"
#include "tether/rpc/engine.hpp"
#include "tether/client.hpp"
