#pragma once

// Core structures
#include "structure/error.hpp"
#include "structure/event.hpp"
#include "structure/options.hpp"
#include "structure/transition.hpp"

// Browser capability, builder and replay log
#include "browser.hpp"
#include "builder.hpp"
#include "replay_log.hpp"
