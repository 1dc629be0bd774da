/*!
 * \file    EE25_DriverImpl.h
 * \brief   Implementation of the EE25 driver template. Included by EE25.h only.
 * \author  Kaloyan Dimitrov
 * \copyright Copyright (c) 2025 Kaloyan Dimitrov
 *            https://github.com/kaladim
 *            SPDX-License-Identifier: MIT
 */
#ifndef EE25_DRIVERIMPL_H
#define EE25_DRIVERIMPL_H

/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include "EE25_Internal.h"

namespace ee25
{
/******************************************************************************/
/*    Exported operations                                                     */
/******************************************************************************/
template <typename Spi, typename ChipSelect>
Driver<Spi, ChipSelect>::Driver(Spi spi, ChipSelect cs) : _spi(std::move(spi)), _cs(std::move(cs))
{
}

template <typename Spi, typename ChipSelect>
std::pair<Spi, ChipSelect> Driver<Spi, ChipSelect>::release()
{
    return std::pair<Spi, ChipSelect>(std::move(_spi), std::move(_cs));
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::read(uint8_t address, uint8_t *buffer, size_t size)
{
    if (size == 0u)
    {
        return Status::OK;
    }

    const Status status = internal::ValidateReadRequest(address, size);
    if (status != Status::OK)
    {
        return status;
    }

    const uint8_t command[] = {instruction::READ, address};
    return with_chip_select([&]() {
        Status result = spi_write(command, sizeof(command));
        if (result == Status::OK)
        {
            result = spi_transfer(buffer, size);
        }
        return result;
    });
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::write_page(uint8_t address, const uint8_t *data, size_t size)
{
    const Status status = internal::ValidatePageWrite(address, size);
    if ((status != Status::OK) || (size == 0u))
    {
        return status;
    }

    const uint8_t command[] = {instruction::WRITE, address};
    return with_write_latch([&]() {
        Status result = spi_write(command, sizeof(command));
        if (result == Status::OK)
        {
            result = spi_write(data, size);
        }
        return result;
    });
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::write_byte(uint8_t address, uint8_t value)
{
    const uint8_t command[] = {instruction::WRITE, address, value};
    return with_write_latch([&]() { return spi_write(command, sizeof(command)); });
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::read_eui48(Eui48 &eui48)
{
    return read(EUI48_MEMORY_ADDRESS, eui48.data(), eui48.size());
}

/******************************************************************************/
/*    Private operations                                                      */
/******************************************************************************/
/*!
 * \brief Runs \p operation with the chip-select line asserted.
 * \note  The line is released after the operation whatever its result, also when the operation throws.
 *        A failure to release it overrides the result. An exception is rethrown after the release.
 */
template <typename Spi, typename ChipSelect>
template <typename Operation>
Status Driver<Spi, ChipSelect>::with_chip_select(Operation operation)
{
    int io_status = _cs.set_low();
    if (io_status != IO_OK)
    {
        _last_io_error = io_status;
        return Status::PIN_ERROR;
    }

    Status result = Status::OK;
    try
    {
        result = operation();
    }
    catch (...)
    {
        io_status = _cs.set_high();
        if (io_status != IO_OK)
        {
            _last_io_error = io_status;
        }
        throw;
    }

    io_status = _cs.set_high();
    if (io_status != IO_OK)
    {
        _last_io_error = io_status;
        return Status::PIN_ERROR;
    }
    return result;
}

/*!
 * \brief Runs \p operation in its own frame, after setting the write enable latch in a preceding frame.
 * \note  On success the device resets the latch itself when the write cycle starts.
 *        On failure the latch is reset here. A failure of that reset overrides the original error.
 *        An exception thrown by the operation is rethrown after the reset.
 */
template <typename Spi, typename ChipSelect>
template <typename Operation>
Status Driver<Spi, ChipSelect>::with_write_latch(Operation operation)
{
    Status status = send_instruction(instruction::WREN);
    if (status != Status::OK)
    {
        return status;
    }

    Status result = Status::OK;
    try
    {
        result = with_chip_select(operation);
    }
    catch (...)
    {
        // The exception takes precedence, a failed reset shows in last_io_error()
        static_cast<void>(send_instruction(instruction::WRDI));
        throw;
    }

    if (result != Status::OK)
    {
        status = send_instruction(instruction::WRDI);
        if (status != Status::OK)
        {
            return status;
        }
    }
    return result;
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::send_instruction(uint8_t instruction_code)
{
    return with_chip_select([&]() { return spi_write(&instruction_code, 1u); });
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::spi_write(const uint8_t *data, size_t size)
{
    const int io_status = _spi.write(data, size);
    if (io_status != IO_OK)
    {
        _last_io_error = io_status;
        return Status::SPI_ERROR;
    }
    return Status::OK;
}

template <typename Spi, typename ChipSelect>
Status Driver<Spi, ChipSelect>::spi_transfer(uint8_t *buffer, size_t size)
{
    const int io_status = _spi.transfer(buffer, size);
    if (io_status != IO_OK)
    {
        _last_io_error = io_status;
        return Status::SPI_ERROR;
    }
    return Status::OK;
}

} // namespace ee25

#endif /* EE25_DRIVERIMPL_H */
