
#pragma once

/**
 * @defgroup weft Weft
 */

/**
 * @defgroup weft-utils Utilities
 * @ingroup weft
 */

#include "utils/base-include.hpp"

#include "utils/cli-utils.hpp"
#include "utils/error-codes.hpp"
#include "utils/serialize.hpp"
