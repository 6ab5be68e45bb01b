// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "weft/demo/app-service.hpp"
#include "weft/demo/config.hpp"
#include "weft/portable/asio/asio-execution-context.hpp"
#include "weft/rpc.hpp"

#include <fmt/format.h>

namespace weft {

namespace {
  // ------------------------------------------------------------------------------- exercise calls

  template <typename Client> bool exercise_calls(const demo::Config& config, const Client& client) {
    bool success = true;
    auto report = [&success](std::string_view call, error_code ec) {
      LOG_ERR("{} failed: {}", call, ec.message());
      success = false;
    };

    if (auto version = client.version(); version)
      fmt::print("AppVersion       -> {}\n", *version);
    else
      report("AppVersion", version.error());

    const auto calc = client.inner().calc();

    if (auto sum = calc.add(40, 2); sum)
      fmt::print("Add(40, 2)       -> {}\n", *sum);
    else
      report("Add", sum.error());

    if (auto sum = calc.sum({1, 2, 3, 4}); sum)
      fmt::print("Sum(1, 2, 3, 4)  -> {}\n", *sum);
    else
      report("Sum", sum.error());

    if (auto values = calc.fibonacci(10); values)
      fmt::print("Fibonacci(10)    -> [{}]\n", fmt::join(*values, ", "));
    else
      report("Fibonacci", values.error());

    if (auto call = calc.multiply(3); call) {
      std::vector<int64_t> products;
      for (int64_t x = 1; x <= 4; ++x) {
        if (auto ec = call->updates.send(demo::calc::MultiplyUpdate{x})) {
          report("Multiply update", ec);
          break;
        }
        auto item = call->responses.next();
        if (!item || !*item) {
          report("Multiply", item ? item->error() : make_error_code(ecode::connection_closed));
          break;
        }
        products.push_back((*item)->value);
      }
      call->updates.close();
      fmt::print("Multiply(3)      -> [{}]\n", fmt::join(products, ", "));
    } else {
      report("Multiply", call.error());
    }

    if (auto stream = client.inner().clock().tick(); stream) {
      for (uint32_t i = 0; i < config.tick_count; ++i) {
        auto item = stream->next();
        if (!item)
          break;
        if (!*item) {
          report("Tick", item->error());
          break;
        }
        fmt::print("Tick             -> {}\n", (*item)->tick);
      }
    } else {
      report("Tick", stream.error());
    }

    return success;
  }

  // ------------------------------------------------------------------------------------ run demo

  template <typename Endpoint, typename Connection>
  int run_demo(const demo::Config& config, Endpoint endpoint, Connection connection) {
    AsioExecutionContext pool{config.thread_count};
    pool.run();

    demo::app::Handler handler{config.app_version, pool.get_executor(),
                               std::chrono::milliseconds{config.tick_millis}};

    rpc::RpcServer<demo::app::Service, Endpoint> server{std::move(endpoint)};
    pool.post([server, handler]() { rpc::run_accept_loop(server, handler); });

    bool success = false;
    {
      const demo::app::Client client{
          rpc::RpcClient<demo::app::Service, Connection>{std::move(connection)}};
      success = exercise_calls(config, client);
    } // the last connection handle goes here, which ends the accept loop

    handler.stop();
    return success ? EXIT_SUCCESS : EXIT_FAILURE;
  }
} // namespace

int main(int argc, char** argv) {
  const auto config = demo::parse_command_line(argc, argv);
  if (config.has_error) {
    fmt::print(stderr, "Aborting due to previous errors...\n");
    return EXIT_FAILURE;
  }
  if (config.show_help) {
    demo::show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  INFO("running demo over the '{}' transport, {} threads", demo::str(config.transport),
       config.thread_count);

  using Req = demo::app::Service::Req;
  using Res = demo::app::Service::Res;
  if (config.transport == demo::TransportKind::WIRE) {
    auto [endpoint, connection] = rpc::wire::connection<Req, Res>(config.channel_capacity);
    return run_demo(config, std::move(endpoint), std::move(connection));
  }
  auto [endpoint, connection] = rpc::mem::connection<Req, Res>(config.channel_capacity);
  return run_demo(config, std::move(endpoint), std::move(connection));
}

} // namespace weft

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return weft::main(argc, argv); }

#endif
