
#pragma once

#include "rpc/accept-loop.hpp"
#include "rpc/client.hpp"
#include "rpc/connection.hpp"
#include "rpc/message-mapping.hpp"
#include "rpc/message.hpp"
#include "rpc/server.hpp"
#include "rpc/transport/boxed.hpp"
#include "rpc/transport/mapped.hpp"
#include "rpc/transport/mem-connection.hpp"
#include "rpc/transport/wire-connection.hpp"
#include "rpc/wire-codec.hpp"
