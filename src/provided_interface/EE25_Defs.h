/*!
 * \file    EE25_Defs.h
 * \brief   Geometry, instruction set and status codes of the 25AA02E48 driver.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_DEFS_H
#define EE25_DEFS_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include <array>
#include <cstddef>
#include <cstdint>

namespace ee25
{
/******************************************************************************/
/*    Instruction set                                                         */
/******************************************************************************/
namespace instruction
{
constexpr uint8_t READ  = 0x03u; /**< Read data from memory array beginning at selected address */
constexpr uint8_t WRITE = 0x02u; /**< Write data to memory array beginning at selected address */
constexpr uint8_t WRDI  = 0x04u; /**< Reset the write enable latch (disable write operations) */
constexpr uint8_t WREN  = 0x06u; /**< Set the write enable latch (enable write operations) */
constexpr uint8_t RDSR  = 0x05u; /**< Read STATUS register */
constexpr uint8_t WRSR  = 0x01u; /**< Write STATUS register */
} // namespace instruction

/******************************************************************************/
/*    Geometry                                                                */
/******************************************************************************/
constexpr size_t  MEMORY_SIZE = 256u;
constexpr uint8_t MAX_ADDRESS = 0xFFu;
constexpr uint8_t PAGE_SIZE   = 16u;
constexpr uint8_t PAGE_COUNT  = MEMORY_SIZE / PAGE_SIZE;

/** Factory-programmed EUI-48 node address, located in the write-protected upper quarter of the array */
constexpr uint8_t EUI48_MEMORY_ADDRESS = 0xFAu;
constexpr size_t  EUI48_BYTES          = 6u;

/******************************************************************************/
/*    Types                                                                   */
/******************************************************************************/
/** Result of every driver operation */
enum class Status : uint8_t
{
    OK = 0,
    SPI_ERROR,                /**< The SPI transport reported an error. See Driver::last_io_error() */
    PIN_ERROR,                /**< The chip-select pin reported an error. See Driver::last_io_error() */
    ADDRESS_NOT_PAGE_ALIGNED, /**< Page writes must start at a multiple of #PAGE_SIZE */
    DATA_TOO_LONG,            /**< Page write payload exceeds #PAGE_SIZE */
    BUFFER_TOO_LARGE,         /**< Read buffer exceeds #MEMORY_SIZE */
    ADDRESS_INVALID           /**< Read runs past #MAX_ADDRESS. Reported only with EE25_STRICT_READ_BOUNDS */
};

typedef std::array<uint8_t, EUI48_BYTES> Eui48;

/** Return value of a successful call to a required interface (SPI transport, chip-select) */
constexpr int IO_OK = 0;

} // namespace ee25

#endif /* EE25_DEFS_H */
