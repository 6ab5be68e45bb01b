
#pragma once

// Precompiled header for every weft target.
#include "weft/async.hpp"
#include "weft/utils.hpp"
