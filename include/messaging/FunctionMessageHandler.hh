/** \file
 *
 * \brief Definition of Clue::Messaging::FunctionMessageHandler class
 */

#ifndef MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
#define MESSAGING_FUNCTIONMESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "messaging/MessageHandler.hh"
#include "messaging/Replies.hh"
#include "messaging/SerializationFailureException.hh"
#include "Blob.hh"

#include <algorithm>
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace Clue {
namespace Messaging {

/** \brief Failed reply to a message
 *
 * The status of a failed reply is REPLY_FAILURE followed by \ref suffix. An
 * empty suffix means a generic failure.
 *
 * \sa Reply
 */
struct ReplyFailure {
    Blob suffix;  ///< \brief Suffix appended to the failure status
};

/** \brief Successful reply to a message
 *
 * A successful reply contains zero or more values passed back to the sender
 * as key–value frames.
 *
 * \tparam Args the types of the values
 *
 * \sa Reply
 */
template<typename... Args>
struct ReplySuccess {

    /** \brief Create ReplySuccess from compatible ReplySuccess
     */
    template<typename... Args2>
    ReplySuccess(ReplySuccess<Args2...> other) :
        arguments(std::move(other.arguments))
    {
    }

    /** \brief Create ReplySuccess from tuple
     *
     * \param args the values of the reply
     */
    template<typename... Args2>
    explicit ReplySuccess(std::tuple<Args2...> args) :
        arguments(std::move(args))
    {
    }

    /** \brief The values of the reply
     */
    std::tuple<Args...> arguments;
};

/** \brief Reply of a function handled by FunctionMessageHandler
 */
template<typename... Args>
struct Reply {

    /** \brief Types of the values of a successful reply
     */
    using Types = std::tuple<Args...>;

    /** \brief Create successful reply
     */
    template<typename... Args2>
    Reply(ReplySuccess<Args2...> reply) : reply {std::move(reply)}
    {
    }

    /** \brief Create failed reply
     */
    Reply(ReplyFailure reply) : reply {std::move(reply)}
    {
    }

    /** \brief The successful or the failed reply
     */
    std::variant<ReplyFailure, ReplySuccess<Args...>> reply;
};

/** \brief Create successful reply
 *
 * \param args the values of the reply
 */
template<typename... Args>
auto success(Args&&... args)
{
    return ReplySuccess<std::decay_t<Args>...> {
        std::make_tuple(std::forward<Args>(args)...)};
}

/** \brief Create failed reply
 *
 * \param suffix suffix appended to the failure status
 */
inline auto failure(Blob suffix = {})
{
    return ReplyFailure {std::move(suffix)};
}

/// \cond DOXYGEN_IGNORE

namespace FunctionMessageHandlerImpl {

template<typename T>
struct ParamWrapperImplBase {
    using WrappedType = std::optional<T>;
    using DeserializedType = T;
    static void wrap(DeserializedType&& param, WrappedType& wrapper)
    {
        wrapper.emplace(std::move(param));
    }
};

template<typename T>
struct ParamWrapperImpl : public ParamWrapperImplBase<T> {
    using typename ParamWrapperImplBase<T>::WrappedType;
    static constexpr bool optional = false;
    static auto& unwrap(WrappedType& wrapper) { return *wrapper; }
};

template<typename T>
struct ParamWrapperImpl<std::optional<T>> : public ParamWrapperImplBase<T> {
    using typename ParamWrapperImplBase<T>::WrappedType;
    static constexpr bool optional = true;
    static auto& unwrap(WrappedType& wrapper) { return wrapper; }
};

template<typename SerializationPolicy, std::size_t REPLY_SIZE>
class ReplyVisitor {
public:

    ReplyVisitor(
        SerializationPolicy& serializer, Response& response,
        const std::array<Blob, REPLY_SIZE>& replyKeys) :
        serializer {serializer},
        response {response},
        replyKeys {replyKeys}
    {
    }

    void operator()(const ReplyFailure& reply)
    {
        response.setStatus(makeFailureStatus(reply.suffix));
    }

    template<typename... Args2>
    void operator()(const ReplySuccess<Args2...>& reply)
    {
        response.setStatus(REPLY_SUCCESS);
        addFrames(reply.arguments, std::index_sequence_for<Args2...> {});
    }

private:

    template<std::size_t N, typename T>
    void addFrame(const T& t)
    {
        response.addFrame(std::get<N>(replyKeys));
        response.addFrame(asBytes(serializer.serialize(t)));
    }

    template<std::size_t N, typename T>
    void addFrame(const std::optional<T>& t)
    {
        if (t) {
            addFrame<N>(*t);
        }
    }

    template<typename... Args2, std::size_t... Ns>
    void addFrames(
        const std::tuple<Args2...>& args, std::index_sequence<Ns...>)
    {
        ( ... , addFrame<Ns>(std::get<Ns>(args)) );
    }

    SerializationPolicy& serializer;
    Response& response;
    const std::array<Blob, REPLY_SIZE>& replyKeys;
};

}

/// \endcond

/** \brief Class that adapts a function into MessageHandler interface
 *
 * FunctionMessageHandler deserializes the arguments of a command, given as
 * key–value frames, and calls the function with the identity of the sender
 * followed by the arguments in the order of their keys. The function returns
 * a \ref Reply. A failed reply sets the failure status. The values of a
 * successful reply are serialized and added as key–value frames after the
 * success status.
 *
 * An argument of type \c std::optional<T> may be omitted from the
 * message. Otherwise a missing argument, a key without value or a value that
 * cannot be deserialized fails the command without calling the function.
 * Frames with unrecognized keys are ignored. An empty optional value in a
 * successful reply is omitted.
 *
 * \tparam Function the type of the function
 * \tparam SerializationPolicy see \ref serializationpolicy
 * \tparam Args the types of the arguments of the function, excluding the
 * leading identity
 *
 * \sa makeMessageHandler()
 */
template<typename Function, typename SerializationPolicy, typename... Args>
class FunctionMessageHandler : public MessageHandler {
public:

    /** \brief Create function message handler
     *
     * \param function the function handling the command
     * \param serializer the serialization policy
     * \param keys tuple containing the keys of the arguments, in the order
     * of the parameters of \p function
     * \param replyKeys tuple containing the keys of the values of the reply,
     * in the order of the values in the Reply returned by \p function
     */
    template<typename Keys, typename ReplyKeys>
    FunctionMessageHandler(
        Function function, SerializationPolicy serializer,
        Keys&& keys, ReplyKeys&& replyKeys);

private:

    void doHandle(
        const Identity& identity, const ParameterVector& params,
        Response& response) override;

    template<typename T>
    using ParamWrapper = FunctionMessageHandlerImpl::ParamWrapperImpl<
        std::decay_t<T>>;

    using ResultType = std::invoke_result_t<
        Function&, const Identity&, std::decay_t<Args>&&...>;

    static constexpr auto ARGS_SIZE = sizeof...(Args);
    static constexpr auto REPLY_SIZE =
        std::tuple_size_v<typename ResultType::Types>;

    template<typename Keys, std::size_t... Ns>
    static auto makeKeys(const Keys& keys, std::index_sequence<Ns...>);

    template<std::size_t N, typename WrappedType>
    bool deserializeAndWrapArg(ByteSpan from, WrappedType& to);

    template<std::size_t... Ns>
    void callFunction(
        const Identity& identity, const ParameterVector& params,
        Response& response, std::index_sequence<Ns...>);

    Function function;
    SerializationPolicy serializer;
    std::array<Blob, ARGS_SIZE> argKeys;
    std::array<Blob, REPLY_SIZE> replyKeys;
};

template<typename Function, typename SerializationPolicy, typename... Args>
template<typename Keys, std::size_t... Ns>
auto FunctionMessageHandler<Function, SerializationPolicy, Args...>::makeKeys(
    [[maybe_unused]] const Keys& keys, std::index_sequence<Ns...>)
{
    return std::array<Blob, sizeof...(Ns)> {
        stringToBlob(std::get<Ns>(keys))...
    };
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<typename Keys, typename ReplyKeys>
FunctionMessageHandler<Function, SerializationPolicy, Args...>::
FunctionMessageHandler(
    Function function, SerializationPolicy serializer, Keys&& keys,
    ReplyKeys&& replyKeys) :
    function(std::move(function)),
    serializer(std::move(serializer)),
    argKeys {makeKeys(keys, std::index_sequence_for<Args...> {})},
    replyKeys {makeKeys(replyKeys, std::make_index_sequence<REPLY_SIZE> {})}
{
    static_assert(
        ARGS_SIZE == std::tuple_size_v<std::decay_t<Keys>>,
        "Number of keys must match the number of arguments");
    static_assert(
        REPLY_SIZE == std::tuple_size_v<std::decay_t<ReplyKeys>>,
        "Number of reply keys must match the number of values in the reply");
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<std::size_t N, typename WrappedType>
bool FunctionMessageHandler<Function, SerializationPolicy, Args...>::
deserializeAndWrapArg(ByteSpan from, WrappedType& to)
{
    using ArgType = std::tuple_element_t<N, std::tuple<Args...>>;
    using DeserializedType = typename ParamWrapper<ArgType>::DeserializedType;
    if (from.data() == nullptr) {
        return ParamWrapper<ArgType>::optional;
    }
    auto deserialized_param =
        serializer.template deserialize<DeserializedType>(from);
    ParamWrapper<ArgType>::wrap(std::move(deserialized_param), to);
    return true;
}

template<typename Function, typename SerializationPolicy, typename... Args>
template<std::size_t... Ns>
void FunctionMessageHandler<Function, SerializationPolicy, Args...>::
callFunction(
    const Identity& identity, const ParameterVector& params,
    Response& response, std::index_sequence<Ns...>)
{
    // a null span marks a missing argument
    auto params_to_deserialize = std::array<ByteSpan, ARGS_SIZE> {};
    auto first = params.begin();
    const auto last = params.end();
    while (first != last) {
        const auto arg_key_iter = std::find(
            argKeys.begin(), argKeys.end(), *first);
        ++first;
        if (first == last) {
            response.setStatus(REPLY_FAILURE);
            return;
        }
        if (arg_key_iter != argKeys.end()) {
            const auto n = static_cast<std::size_t>(
                arg_key_iter - argKeys.begin());
            params_to_deserialize[n] = *first;
        }
        ++first;
    }

    [[maybe_unused]] auto wrapped_params =
        std::tuple<typename ParamWrapper<Args>::WrappedType...> {};
    auto all_valid = false;
    try {
        all_valid = ( ... && deserializeAndWrapArg<Ns>(
            std::get<Ns>(params_to_deserialize),
            std::get<Ns>(wrapped_params)) );
    } catch (const SerializationFailureException&) {
        all_valid = false;
    }
    if (!all_valid) {
        response.setStatus(REPLY_FAILURE);
        return;
    }

    auto result = std::invoke(
        function, identity,
        std::move(ParamWrapper<Args>::unwrap(std::get<Ns>(wrapped_params)))...);
    std::visit(
        FunctionMessageHandlerImpl::ReplyVisitor<
            SerializationPolicy, REPLY_SIZE> {serializer, response, replyKeys},
        result.reply);
}

template<typename Function, typename SerializationPolicy, typename... Args>
void FunctionMessageHandler<Function, SerializationPolicy, Args...>::doHandle(
    const Identity& identity, const ParameterVector& params,
    Response& response)
{
    callFunction(
        identity, params, response, std::index_sequence_for<Args...> {});
}

/** \brief Wrap function into message handler
 *
 * \tparam Args the types of the arguments of the function, excluding the
 * leading identity. They cannot be deduced for a general function object.
 *
 * \param function the function
 * \param serializer the serialization policy
 * \param keys tuple containing the keys of the arguments
 * \param replyKeys tuple containing the keys of the values of the reply
 *
 * \return the message handler
 */
template<
    typename... Args, typename Function, typename SerializationPolicy,
    typename Keys = std::tuple<>, typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Function&& function, SerializationPolicy&& serializer, Keys&& keys = {},
    ReplyKeys&& replyKeys = {})
{
    return std::make_shared<
        FunctionMessageHandler<
            std::decay_t<Function>, std::decay_t<SerializationPolicy>,
            Args...>>(
        std::forward<Function>(function),
        std::forward<SerializationPolicy>(serializer),
        std::forward<Keys>(keys),
        std::forward<ReplyKeys>(replyKeys));
}

/** \brief Wrap member function call into message handler
 *
 * \note The handler stores a reference to \p handler, which must outlive
 * the returned message handler.
 *
 * \param handler the object the member function is called on
 * \param memfn pointer to the member function
 * \param serializer the serialization policy
 * \param keys tuple containing the keys of the arguments
 * \param replyKeys tuple containing the keys of the values of the reply
 *
 * \return the message handler
 */
template<
    typename Handler, typename ReplyType, typename... Args,
    typename SerializationPolicy, typename Keys = std::tuple<>,
    typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Handler& handler, ReplyType (Handler::*memfn)(const Identity&, Args...),
    SerializationPolicy&& serializer, Keys&& keys = {},
    ReplyKeys&& replyKeys = {})
{
    return makeMessageHandler<Args...>(
        [&handler, memfn](
            const Identity& identity, std::decay_t<Args>&&... args)
        {
            return (handler.*memfn)(identity, std::move(args)...);
        },
        std::forward<SerializationPolicy>(serializer),
        std::forward<Keys>(keys),
        std::forward<ReplyKeys>(replyKeys));
}

}
}

#endif // MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
