/*!
 * \file    EE25_Validation.cpp
 * \brief   Addressing and length checks of the EE25 driver.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include "EE25_Config.h"
#include "EE25_Internal.h"

namespace ee25
{
namespace internal
{
/******************************************************************************/
/*    Internal operations                                                     */
/******************************************************************************/
Status ValidateRead(uint8_t address, size_t size, bool strict_bounds)
{
    if (size > MEMORY_SIZE)
    {
        return Status::BUFFER_TOO_LARGE;
    }

    // Otherwise the address counter of the device rolls over to 0x00
    if (strict_bounds && (size > 0u) && ((address + size - 1u) > MAX_ADDRESS))
    {
        return Status::ADDRESS_INVALID;
    }
    return Status::OK;
}

Status ValidateReadRequest(uint8_t address, size_t size)
{
    return ValidateRead(address, size, EE25_STRICT_READ_BOUNDS != 0);
}

Status ValidatePageWrite(uint8_t address, size_t size)
{
    if ((address % PAGE_SIZE) != 0u)
    {
        return Status::ADDRESS_NOT_PAGE_ALIGNED;
    }

    if (size > PAGE_SIZE)
    {
        return Status::DATA_TOO_LONG;
    }
    return Status::OK;
}

} // namespace internal
} // namespace ee25
