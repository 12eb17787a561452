#pragma once

// Umbrella header included by every generated error header
#include "ctxerr/support/context.hpp"
#include "ctxerr/support/display.hpp"
#include "ctxerr/support/overloaded.hpp"
