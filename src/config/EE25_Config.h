/*!
 * \file    EE25_Config.h
 * \brief   Compile-time configuration of the EE25 driver.
 * \note    Every option can be overridden from the build system, e.g. -DEE25_STRICT_READ_BOUNDS=1
 *          The options are read by the compiled part of the driver only. Define them where the library is built.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_CONFIG_H
#define EE25_CONFIG_H

/*!
 * \brief Read range policy.
 *        0: a read may run past 0xFF, the device address counter rolls over to 0x00 (default, matches the hardware).
 *        1: a read running past 0xFF is rejected with Status::ADDRESS_INVALID before any bus activity (legacy).
 */
#ifndef EE25_STRICT_READ_BOUNDS
#define EE25_STRICT_READ_BOUNDS 0
#endif

#endif /* EE25_CONFIG_H */
