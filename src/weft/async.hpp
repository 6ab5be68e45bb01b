
#pragma once

/**
 * @defgroup async Async
 * @ingroup weft
 *
 * Blocking primitives for threads that cooperate through an asio thread pool.
 */

#include "async/notify.hpp"
#include "async/periodic-task.hpp"
#include "async/pipe.hpp"
