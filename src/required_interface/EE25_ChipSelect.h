/*!
 * \file    EE25_ChipSelect.h
 * \brief   Interface to the digital output driving the chip-select line, expected by the EE25 driver.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_CHIPSELECT_H
#define EE25_CHIPSELECT_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include <type_traits>
#include <utility>
#include "EE25_Defs.h"

namespace ee25
{
/******************************************************************************/
/*    Required operations                                                     */
/******************************************************************************/
/*!
 * The chip-select output is any type providing the following member functions:
 *
 * \code
 * int set_low();   // assert: the EEPROM is selected
 * int set_high();  // deassert: the bus returns to idle
 * \endcode
 *
 * \pre   Synchronous/blocking operations.
 * \pre   The line must already be high when the object is handed over to the driver.
 * \retval #IO_OK on success
 * \retval any other value is an implementation-defined error code. The driver reports it as Status::PIN_ERROR and keeps the code.
 */
template <typename T, typename = int, typename = int>
struct IsChipSelect : std::false_type
{
};

template <typename T>
struct IsChipSelect<T, decltype(std::declval<T &>().set_low()), decltype(std::declval<T &>().set_high())> : std::true_type
{
};

} // namespace ee25

#endif /* EE25_CHIPSELECT_H */
