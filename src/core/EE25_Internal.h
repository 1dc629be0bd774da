/*!
 * \file    EE25_Internal.h
 * \brief   Internally visible operations of the EE25 driver.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_INTERNAL_H
#define EE25_INTERNAL_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include <cstddef>
#include <cstdint>
#include "EE25_Defs.h"

namespace ee25
{
namespace internal
{
/******************************************************************************/
/*    Internal operations                                                     */
/******************************************************************************/
/*!
 * \brief     Validates the parameters of a read request.
 * \param[in] address start address
 * \param[in] size byte count, 0 is accepted
 * \param[in] strict_bounds reject requests running past #MAX_ADDRESS instead of letting the device wrap around
 * \retval    Status::OK
 * \retval    Status::BUFFER_TOO_LARGE if \p size exceeds #MEMORY_SIZE
 * \retval    Status::ADDRESS_INVALID if \p strict_bounds is set and the last byte lies beyond #MAX_ADDRESS
 */
Status ValidateRead(uint8_t address, size_t size, bool strict_bounds);

/*!
 * \brief     Validates a read request with the read range policy the library was built with (#EE25_STRICT_READ_BOUNDS).
 * \note      The policy is compiled into the library only, so every driver instantiation of a program shares it.
 * \param[in] address start address
 * \param[in] size byte count, 0 is accepted
 * \return    see ValidateRead()
 */
Status ValidateReadRequest(uint8_t address, size_t size);

/*!
 * \brief     Validates the parameters of a page write request.
 * \note      Alignment is checked first, so an unaligned empty write is still rejected.
 * \param[in] address start address
 * \param[in] size payload length, 0 is accepted
 * \retval    Status::OK
 * \retval    Status::ADDRESS_NOT_PAGE_ALIGNED
 * \retval    Status::DATA_TOO_LONG if \p size exceeds #PAGE_SIZE
 */
Status ValidatePageWrite(uint8_t address, size_t size);

} // namespace internal
} // namespace ee25

#endif /* EE25_INTERNAL_H */
