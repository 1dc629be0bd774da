/*!
 * \file    EE25.h
 * \brief   Interface of the Microchip 25AA02E48 SPI EEPROM driver to applications.
 * \details The 25AA02E48 is a 2 Kbit (256 x 8) serial EEPROM with 16-byte pages.
 *          The upper quarter of its array is write-protected and holds a factory-programmed EUI-48 node address at 0xFA..0xFF.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_H
#define EE25_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include <cstddef>
#include <cstdint>
#include <utility>
#include "EE25_Defs.h"
#include "EE25_Spi.h"
#include "EE25_ChipSelect.h"

namespace ee25
{
/******************************************************************************/
/*    Types                                                                   */
/******************************************************************************/
/*!
 * \brief   Driver of one 25AA02E48 device.
 * \details Owns the SPI transport and the chip-select output exclusively. See EE25_Spi.h and EE25_ChipSelect.h for the contracts.
 *          Every operation is synchronous: it completes (or fails) on the bus before returning.
 * \note    Not thread-safe. The caller must serialize access to an instance.
 */
template <typename Spi, typename ChipSelect>
class Driver
{
    static_assert(IsSpiTransport<Spi>::value, "Spi must provide int write(const uint8_t*, size_t) and int transfer(uint8_t*, size_t)");
    static_assert(IsChipSelect<ChipSelect>::value, "ChipSelect must provide int set_low() and int set_high()");

  public:
    /*!
     * \brief     Takes ownership of the bus and of the chip-select output. Does not touch the bus.
     * \pre       The chip-select line must already be high (deasserted).
     * \param[in] spi SPI transport
     * \param[in] cs chip-select output
     */
    Driver(Spi spi, ChipSelect cs);

    /*!
     * \brief  Gives the SPI transport and the chip-select output back to the caller. Does not touch the bus.
     * \post   The driver must not be used afterwards.
     */
    std::pair<Spi, ChipSelect> release();

    /*!
     * \brief      Reads from the EEPROM.
     * \note       If address + size exceeds 0xFF, the device address counter rolls over to 0x00 and the read continues from there.
     *             If the library is built with EE25_STRICT_READ_BOUNDS such a request is rejected instead.
     * \param[in]  address start address 0x00..0xFF
     * \param[out] buffer destination, overwritten in place
     * \param[in]  size count of bytes to read, up to #MEMORY_SIZE. Nothing is done for 0.
     * \retval     Status::OK
     * \retval     Status::BUFFER_TOO_LARGE
     * \retval     Status::ADDRESS_INVALID (library built with EE25_STRICT_READ_BOUNDS only)
     * \retval     Status::SPI_ERROR, Status::PIN_ERROR
     */
    Status read(uint8_t address, uint8_t *buffer, size_t size);

    /*!
     * \brief     Writes up to one page.
     * \details   Sets the write enable latch in a frame of its own, then sends the WRITE instruction, the address and the payload in a second frame.
     *            If the second frame fails, the latch is reset with WRDI before returning, so the device never stays write-enabled.
     * \note      Writes into the protected upper quarter (0xC0..0xFF) complete on the bus, but the device leaves the array unchanged.
     * \param[in] address page start address, must be a multiple of #PAGE_SIZE
     * \param[in] data payload
     * \param[in] size payload length, up to #PAGE_SIZE. Nothing is sent for 0.
     * \retval    Status::OK
     * \retval    Status::ADDRESS_NOT_PAGE_ALIGNED, Status::DATA_TOO_LONG
     * \retval    Status::SPI_ERROR, Status::PIN_ERROR. If the WRDI recovery fails as well, its error is reported.
     */
    Status write_page(uint8_t address, const uint8_t *data, size_t size);

    /*!
     * \brief     Writes a single byte at any address.
     * \details   Same write enable latch handling as #write_page().
     */
    Status write_byte(uint8_t address, uint8_t value);

    /*!
     * \brief      Reads the EUI-48 node address. Same as read(#EUI48_MEMORY_ADDRESS, eui48.data(), #EUI48_BYTES).
     * \param[out] eui48 the address, most significant byte first
     */
    Status read_eui48(Eui48 &eui48);

    /*!
     * \brief  Error code of the most recent failed call to the SPI transport or the chip-select output.
     * \retval #IO_OK if none has failed so far
     */
    int last_io_error() const { return _last_io_error; }

  private:
    template <typename Operation>
    Status with_chip_select(Operation operation);

    template <typename Operation>
    Status with_write_latch(Operation operation);

    Status send_instruction(uint8_t instruction_code);
    Status spi_write(const uint8_t *data, size_t size);
    Status spi_transfer(uint8_t *buffer, size_t size);

    Spi        _spi;
    ChipSelect _cs;
    int        _last_io_error{IO_OK};
};

/******************************************************************************/
/*    Exported operations                                                     */
/******************************************************************************/
/*!
 * \brief Creates a driver, deducing the transport and chip-select types.
 */
template <typename Spi, typename ChipSelect>
Driver<Spi, ChipSelect> MakeDriver(Spi spi, ChipSelect cs)
{
    return Driver<Spi, ChipSelect>(std::move(spi), std::move(cs));
}

} // namespace ee25

#include "EE25_DriverImpl.h"

#endif /* EE25_H */
