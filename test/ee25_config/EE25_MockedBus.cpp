/******************************************************************************/
/*    Dependencies                                                            */
/******************************************************************************/
#include "EE25_Defs.h"
#include "EE25_Spi_Mock.hpp"
#include "EE25_ChipSelect_Mock.hpp"

// Define the static instance pointers (initialized to nullptr by default)
MockSpi*        MockSpi::instance        = nullptr;
MockChipSelect* MockChipSelect::instance = nullptr;

namespace
{
constexpr int no_mock_error = -1;
}

/******************************************************************************/
/*    Required operations by the EE25 driver                                  */
/******************************************************************************/
int MockedSpi::write(const uint8_t* data, size_t size)
{
    if (MockSpi::instance)
    {
        return MockSpi::instance->write(std::vector<uint8_t>(data, data + size));
    }
    return no_mock_error;
}

int MockedSpi::transfer(uint8_t* buffer, size_t size)
{
    if (MockSpi::instance)
    {
        return MockSpi::instance->transfer(buffer, size);
    }
    return no_mock_error;
}

int MockedChipSelect::set_low()
{
    if (MockChipSelect::instance)
    {
        return MockChipSelect::instance->set_low();
    }
    return no_mock_error;
}

int MockedChipSelect::set_high()
{
    if (MockChipSelect::instance)
    {
        return MockChipSelect::instance->set_high();
    }
    return no_mock_error;
}
