
#pragma once

#include "message-mapping.hpp"

#include <concepts>

namespace weft::rpc {

// -------------------------------------------------------------------------------------- Patterns

/** @ingroup rpc @brief One request, one response */
struct Unary {};

/** @ingroup rpc @brief One request, then a sequence of responses */
struct ServerStreaming {};

/** @ingroup rpc @brief One request, then a sequence of updates, then one response */
struct ClientStreaming {};

/** @ingroup rpc @brief One request, then updates and responses flowing independently */
struct BidiStreaming {};

// --------------------------------------------------------------------------------------- Service

/**
 * @ingroup rpc
 * @brief A service names its two message enumerations, `Req` and `Res`.
 *
 * When an enumeration is a `std::variant`, each alternative must be distinct, or mapping
 * would be ambiguous.
 */
template <typename S>
concept Service = requires {
  typename S::Req;
  typename S::Res;
} && detail::has_unique_alternatives<typename S::Req>::value &&
    detail::has_unique_alternatives<typename S::Res>::value;

// ---------------------------------------------------------------------------------- MessageTraits

namespace detail {
  template <typename M> struct declared_update {};

  template <typename M>
  requires requires { typename M::Update; } struct declared_update<M> {
    using Update = typename M::Update;
  };
} // namespace detail

/**
 * @ingroup rpc
 * @brief Binds a request type to its service, pattern, and response (and update) types.
 *
 * By default these are read from the request type's own `Service`, `Pattern`, `Response` and
 * `Update` member types. Specialize for request types that can't carry them.
 */
template <typename M> struct MessageTraits : detail::declared_update<M> {
  using Service = typename M::Service;
  using Pattern = typename M::Pattern;
  using Response = typename M::Response;
};

template <typename M> using ServiceOf = typename MessageTraits<M>::Service;
template <typename M> using PatternOf = typename MessageTraits<M>::Pattern;
template <typename M> using ResponseOf = typename MessageTraits<M>::Response;
template <typename M> using UpdateOf = typename MessageTraits<M>::Update;

/**
 * @ingroup rpc
 * @brief `M` is a request of service `S`, and it (and its response) map into `S`'s
 *        enumerations.
 */
template <typename M, typename S>
concept Msg = Service<S> && requires {
  typename ServiceOf<M>;
  typename PatternOf<M>;
  typename ResponseOf<M>;
} && std::same_as<ServiceOf<M>, S> && Mappable<typename S::Req, M> &&
    Mappable<typename S::Res, ResponseOf<M>>;

template <typename M, typename S>
concept UnaryMsg = Msg<M, S> && std::same_as<PatternOf<M>, Unary>;

template <typename M, typename S>
concept ServerStreamingMsg = Msg<M, S> && std::same_as<PatternOf<M>, ServerStreaming>;

template <typename M, typename S>
concept ClientStreamingMsg = Msg<M, S> && std::same_as<PatternOf<M>, ClientStreaming> &&
    requires { typename UpdateOf<M>; } && Mappable<typename S::Req, UpdateOf<M>>;

template <typename M, typename S>
concept BidiStreamingMsg = Msg<M, S> && std::same_as<PatternOf<M>, BidiStreaming> &&
    requires { typename UpdateOf<M>; } && Mappable<typename S::Req, UpdateOf<M>>;

/**
 * @ingroup rpc
 * @brief `SInner`'s enumerations are embedded in `SOuter`'s, so a channel of `SOuter` can be
 *        viewed as a channel of `SInner`.
 */
template <typename SOuter, typename SInner>
concept ServiceMappable = Service<SOuter> && Service<SInner> &&
    Mappable<typename SOuter::Req, typename SInner::Req> &&
    Mappable<typename SOuter::Res, typename SInner::Res>;

} // namespace weft::rpc
