/*!
 * \file    EE25_Spi.h
 * \brief   Interface to the SPI bus driver, expected by the EE25 driver.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_SPI_H
#define EE25_SPI_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>
#include "EE25_Defs.h"

namespace ee25
{
/******************************************************************************/
/*    Required operations                                                     */
/******************************************************************************/
/*!
 * The SPI transport is any type providing the following member functions:
 *
 * \code
 * int write(const uint8_t *data, size_t size);
 * int transfer(uint8_t *buffer, size_t size);
 * \endcode
 *
 * \b write sends \p size bytes and discards whatever is clocked in.
 *
 * \b transfer sends \p size bytes from \p buffer and overwrites the same buffer with the bytes clocked in (full duplex, in place).
 *
 * \pre   Both are synchronous/blocking operations.
 * \pre   The transport must not touch the chip-select line. Framing is done by the EE25 driver through the chip-select interface.
 * \retval #IO_OK on success
 * \retval any other value is an implementation-defined error code. The driver reports it as Status::SPI_ERROR and keeps the code.
 * \note   An exception thrown by either call reaches the caller of the driver operation, after the chip-select line is released
 *         and, for writes, after the write enable latch is reset.
 */
template <typename T, typename = int, typename = int>
struct IsSpiTransport : std::false_type
{
};

template <typename T>
struct IsSpiTransport<T,
                      decltype(std::declval<T &>().write(std::declval<const uint8_t *>(), std::declval<size_t>())),
                      decltype(std::declval<T &>().transfer(std::declval<uint8_t *>(), std::declval<size_t>()))> : std::true_type
{
};

} // namespace ee25

#endif /* EE25_SPI_H */
