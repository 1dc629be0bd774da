#include "test_base.hpp"
#include "EE25_Internal.h"

static_assert(EE25_STRICT_READ_BOUNDS == 1, "This suite must be built with EE25_STRICT_READ_BOUNDS=1");

using testing::InSequence;

class StrictReadTest : public TestBase
{
  public:
    void SetUp() override
    {
        TestBase::SetUp(); // Important: Call base class SetUp() first
    }

    void TearDown() override
    {
        TestBase::TearDown();
    }
};

TEST_F(StrictReadTest, ReadingPastLastAddressIsRejectedWithoutBusActivity)
{
    uint8_t data[2]{};

    EXPECT_EQ(eeprom.read(0xFF, data, sizeof(data)), ee25::Status::ADDRESS_INVALID);
    EXPECT_EQ(eeprom.read(0x01, nullptr, ee25::MEMORY_SIZE), ee25::Status::ADDRESS_INVALID);
}

TEST_F(StrictReadTest, LibraryIsBuiltWithStrictPolicy)
{
    EXPECT_EQ(ee25::internal::ValidateReadRequest(0xFF, 2), ee25::Status::ADDRESS_INVALID);
    EXPECT_EQ(ee25::internal::ValidateReadRequest(0xFA, ee25::EUI48_BYTES), ee25::Status::OK);
}

TEST_F(StrictReadTest, ReadLastByte)
{
    {
        InSequence seq;
        ExpectSelect();
        ExpectWrite({ee25::instruction::READ, 0xFF});
        ExpectTransfer({0xAF});
        ExpectDeselect();
    }

    uint8_t data[1]{};
    EXPECT_EQ(eeprom.read(0xFF, data, sizeof(data)), ee25::Status::OK);
    EXPECT_EQ(data[0], 0xAF);
}

TEST_F(StrictReadTest, EmptyReadAtLastAddressIsAccepted)
{
    EXPECT_EQ(eeprom.read(0xFF, nullptr, 0), ee25::Status::OK);
}

TEST_F(StrictReadTest, BufferTooLargeTakesPrecedence)
{
    std::vector<uint8_t> buf(ee25::MEMORY_SIZE + 1);

    EXPECT_EQ(eeprom.read(0x00, buf.data(), buf.size()), ee25::Status::BUFFER_TOO_LARGE);
}

TEST_F(StrictReadTest, Eui48EndsExactlyAtLastAddress)
{
    const std::vector<uint8_t> response{0x00, 0x04, 0xA3, 0x01, 0x02, 0x03};
    {
        InSequence seq;
        ExpectSelect();
        ExpectWrite({ee25::instruction::READ, ee25::EUI48_MEMORY_ADDRESS});
        ExpectTransfer(response);
        ExpectDeselect();
    }

    ee25::Eui48 eui48{};
    EXPECT_EQ(eeprom.read_eui48(eui48), ee25::Status::OK);
    EXPECT_TRUE(std::equal(response.begin(), response.end(), eui48.begin()));
}

TEST_F(StrictReadTest, WholeArrayFromStart)
{
    const auto response = GenerateRandomBytes(ee25::MEMORY_SIZE);
    {
        InSequence seq;
        ExpectSelect();
        ExpectWrite({ee25::instruction::READ, 0x00});
        ExpectTransfer(response);
        ExpectDeselect();
    }

    std::vector<uint8_t> buf(ee25::MEMORY_SIZE);
    EXPECT_EQ(eeprom.read(0x00, buf.data(), buf.size()), ee25::Status::OK);
    EXPECT_EQ(buf, response);
}
