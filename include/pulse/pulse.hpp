// include/pulse/pulse.hpp
// Umbrella header — everything an application needs.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "enrichment.hpp"
#include "error.hpp"
#include "event.hpp"
#include "identity.hpp"
#include "pipeline.hpp"
#include "serialize.hpp"
#include "value.hpp"
