#pragma once

#include <optional>
#include <stddef.h>
#include <utility>
#include <variant>

namespace sh1107
{

/**
 * Error type for capabilities that cannot fail (a plain digitalWrite, SPI.transfer, or the NoOutputPin stand-in).
 *
 * It has no accessible constructor, so a value of this type can never exist and an error axis parameterised with it
 * is statically empty.
 */
class Infallible
{
  private:
    Infallible();
};

/**
 * Outcome of a hardware operation: either success, or an error of type E.
 *
 * Converts to true on success so the usual pattern is
 *
 *     auto r = bus.write(addr, buf, len);
 *     if (!r)
 *         return Result<Error>::err(Error::comm(r.error()));
 */
template <typename E> class Result
{
  public:
    typedef E Error;

    static Result ok() { return Result(); }
    static Result err(const E &e) { return Result(e); }

    bool isOk() const { return !failure.has_value(); }
    explicit operator bool() const { return isOk(); }

    /// Only valid when !isOk()
    const E &error() const { return *failure; }

  private:
    Result() {}
    explicit Result(const E &e) : failure(e) {}

    std::optional<E> failure;
};

/**
 * Error reported by a display interface.
 *
 * Bus (communication) failures and GPIO (pin) failures are kept apart, each carrying the error type of the capability
 * that produced it. An interface that drives no pins uses Infallible for PinE.
 */
template <typename CommE, typename PinE> class InterfaceError
{
  public:
    enum Kind { Comm = 0, Pin = 1 };

    typedef CommE CommError;
    typedef PinE PinError;

    static InterfaceError comm(const CommE &e) { return InterfaceError(std::in_place_index<Comm>, e); }
    static InterfaceError pin(const PinE &e) { return InterfaceError(std::in_place_index<Pin>, e); }

    Kind kind() const { return static_cast<Kind>(payload.index()); }
    bool isComm() const { return kind() == Comm; }
    bool isPin() const { return kind() == Pin; }

    /// Only valid when isComm()
    const CommE &commError() const { return std::get<Comm>(payload); }

    /// Only valid when isPin()
    const PinE &pinError() const { return std::get<Pin>(payload); }

  private:
    template <size_t I, typename T> InterfaceError(std::in_place_index_t<I> idx, const T &e) : payload(idx, e) {}

    std::variant<CommE, PinE> payload;
};

} // namespace sh1107
