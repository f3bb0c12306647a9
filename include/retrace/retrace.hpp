#pragma once

// DOM transitions and replay
#include "dom/dom.hpp"

// Structured export
#include "serialization/transition_serializer.hpp"
