
#include "stdinc.hpp"

#include "app-service.hpp"

#include "weft/utils/serialize.hpp"

namespace weft::demo::app {

error_code write(std::ostream&, const AppVersionRequest&) { return {}; }
error_code read(std::istream&, AppVersionRequest&) { return {}; }

error_code write(std::ostream& out, const AppVersionResponse& x) {
  return weft::write(out, std::string_view{x.version});
}
error_code read(std::istream& in, AppVersionResponse& x) { return weft::read(in, x.version); }

Handler::Handler(std::string version, boost::asio::any_io_executor executor,
                 std::chrono::milliseconds tick_period)
    : inner_{std::move(executor), tick_period},
      version_{std::make_shared<const std::string>(std::move(version))} {}

AppVersionResponse Handler::version(AppVersionRequest) const { return AppVersionResponse{*version_}; }

} // namespace weft::demo::app
