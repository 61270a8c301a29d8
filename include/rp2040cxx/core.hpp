/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Primary header for rp2040cxx interface dependencies.
 *
 * This header provides the build-configuration macros, the error
 * code conventions shared by all rp2040cxx APIs, the fail-safe halt,
 * and the mutex helper classes.
 *
 * @anchor rp2040cxx_mutex Mutex support classes:
 * * @link rp2040cxx::primask@endlink
 * * @link rp2040cxx::null_mutex@endlink
 *
 * @file */

#ifndef RP2040CXX_CORE_HPP
#define RP2040CXX_CORE_HPP
#pragma once

#include <cstddef>
#include <cstdint>

#ifndef RP2040CXX_FAKED
/** Macro defined to preprocessor true for host-based testing.
 *
 * When defined to a non-zero value the faked register bus
 * (<rp2040cxx/faked/bus.hpp>) is available and the library is
 * expected to run on a development host rather than the device.
 *
 * In that situation #RP2040CXX_CROSS_COMPILING should be a
 * preprocessor false (i.e. 0). */
#define RP2040CXX_FAKED 0
#endif /* RP2040CXX_FAKED */

#ifndef RP2040CXX_CROSS_COMPILING
/** Macro defined to preprocessor true when cross-compiling.
 *
 * This is defined to preprocessor false when building on a host for
 * non-embedded testing of implementation. */
#define RP2040CXX_CROSS_COMPILING 1
#endif /* RP2040CXX_CROSS_COMPILING */

/** Primary namespace for rp2040cxx functionality */
namespace rp2040cxx {

namespace gpio {
class driver;
} // ns gpio

/** Namespace holding board-specific configuration data.
 *
 * Most material is put into this namespace through the board-specific
 * <rp2040cxx/board.hpp> header. */
namespace board {

/** Perform board-specific initialization.
 *
 * This function should be invoked at the start of main() to ensure
 * the basic functionality expected of all boards is available.
 *
 * Operations performed by the default implementation include:
 * * gpio::driver::enable_peripheral() for `IO_BANK0` and
 *   `PADS_BANK0`, so pins may be configured on return.
 * * Other boards may need to provide other actions.
 *
 * @return zero on success, or a negative @link error_encoded encoded
 * error@endlink.  Applications generally respond to a failure by
 * invoking failsafe(). */
int initialize (gpio::driver& gpio); // weak implemented in src/core.cc

} // ns board

/** Error codes reported by rp2040cxx operations.
 *
 * Operations that can fail return an `int` which is non-negative on
 * success and the negated code on failure; see error_encoded() and
 * error_decoded().
 *
 * The values of codes listed here are public API and shall not
 * change. */
enum class ErrorCode : int
{
  /** No error. */
  NONE = 0,

  /** A pin identifier outside the range supported by the device was
   * provided.  Detected before any register access. */
  INVALID_PIN = 1,

  /** A peripheral readiness flag was not observed within the polling
   * bound. */
  PERIPHERAL_TIMEOUT = 2,

  /** A direction-specific operation was invoked on a pin not
   * configured for that direction. */
  WRONG_DIRECTION = 3,

  /** A peripheral required by the operation is still held in
   * reset. */
  PERIPHERAL_DISABLED = 4,
};

/** Convert an error code into an API return value. */
constexpr int
error_encoded (ErrorCode ec)
{
  return -static_cast<int>(ec);
}

/** Extract an error code from an API return value.
 *
 * Non-negative return values decode to ErrorCode::NONE. */
constexpr ErrorCode
error_decoded (int rc)
{
  return (0 <= rc) ? ErrorCode::NONE : static_cast<ErrorCode>(-rc);
}

/** Return a short description of an API return value.
 *
 * Non-negative values are described as success. */
const char* error_text (int rc);

/** RAII class that performs no mutex operations.
 *
 * This is used as the default value for template parameters that
 * identify the mutex required to protect an operation in cases where
 * the operation may not need protection. */
class null_mutex
{
public:
  null_mutex ()
  { }

  null_mutex (const null_mutex&) = delete;
  null_mutex& operator= (const null_mutex&) = delete;
  null_mutex (null_mutex&& ) = delete;
  null_mutex& operator= (null_mutex&) = delete;
};

/** RAII class to block exceptions.
 *
 * The PRIMASK configuration is recorded and then disabled.  When the
 * instance is destructed the recorded PRIMASK configuration is
 * restored.
 *
 * Note that this class is safe to use in contexts where interrupts
 * are already disabled: they will not be re-enabled when the object
 * is destructed.  On the host it has no effect. */
class primask
{
public:
  primask () :
    in_mask_{}
  {
#if (RP2040CXX_CROSS_COMPILING - 0)
    __asm__ volatile ("mrs\t%0, primask\n\t"
                      "cpsid\ti"
                      : "=r" (in_mask_)
                      :
                      : "memory");
#endif /* RP2040CXX_CROSS_COMPILING */
  }

  ~primask ()
  {
#if (RP2040CXX_CROSS_COMPILING - 0)
    __asm__ volatile ("msr\tprimask, %0"
                      :
                      : "r" (in_mask_)
                      : "memory");
#endif /* RP2040CXX_CROSS_COMPILING */
  }

  primask (const primask&) = delete;
  primask& operator= (const primask&) = delete;
  primask (primask&& ) = delete;
  primask& operator= (primask&) = delete;

private:
  uint32_t in_mask_;
};

/** Enumerated constants used in failsafe() calls.
 *
 * The values of codes listed here are public API and shall not
 * change. */
enum class FailSafeCode : unsigned int
{
  /** Base for system-assigned fail-safe codes. */
  SYSTEM_BASE = 0xbad00000,

  /** Application attempted to retrieve a non-existent
   * peripheral instance. */
  NO_SUCH_PERIPHERAL = SYSTEM_BASE + 1,

  /** Unspecified internal error. */
  INTERNAL_ERROR = SYSTEM_BASE + 6,

  /** Application failed to perform all steps required to run. */
  INCOMPLETE_SETUP = SYSTEM_BASE + 7,

  /** Application tried something that isn't allowed. */
  API_VIOLATION = SYSTEM_BASE + 9,

  /** Board setup failed in some critical way.
   *
   * An example is a GPIO peripheral that never leaves reset.  If this
   * failure occurs nothing beyond the processor core can be assumed
   * to be functional. */
  BOARD_INIT_FAILURE = SYSTEM_BASE + 10,

  /** Application left the main loop. */
  EVENT_LOOP_TERMINATED = SYSTEM_BASE + 11,

  /** Base for application-assigned fail-safe codes.
   *
   * Type-correct application code values can be obtained by adding to
   * this value, as with:
   *
   *     FailSafeCode mycode{FailSafeCode::APPLICATION_BASE + 2}
   */
  APPLICATION_BASE = 0xbad10000,
};
static inline
FailSafeCode operator+ (const FailSafeCode& lhs,
                        unsigned int incr)
{
  return static_cast<FailSafeCode>(static_cast<unsigned int>(lhs) + incr);
}

/** Record a critical system failure and halt.
 *
 * This API should be used in situations where normal operation
 * followed a path that led to an unrecoverable fatal error, such as a
 * peripheral that never leaves reset during system initialization.
 *
 * There is no supervising process to report to, so the code is
 * recorded in failsafe_code(), interrupts are masked, and the
 * processor idles in an infinite loop.  The system is not reset.
 *
 * @param code the reason for the failure. */
[[noreturn]] void failsafe (FailSafeCode code);

/** @overload */
[[noreturn]] void failsafe (unsigned int code);

/** Return the code recorded by the most recent failsafe() invocation,
 * or zero if none has occurred. */
unsigned int failsafe_code ();

} // ns rp2040cxx

#endif /* RP2040CXX_CORE_HPP */
