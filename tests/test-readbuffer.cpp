#include "readbuffer.hpp"
#include "gtest/gtest.h"
#include <cstring>
#include <iostream>

class ReadBufferTest : public ::testing::Test
{

public:
    virtual void SetUp()
    {
    }

    virtual void TearDown()
    {
    }
};

TEST_F( ReadBufferTest, readUInt8 )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02, 0x03, };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_EQ( 0x00, msg.readUInt8() );
    EXPECT_EQ( 0x01, msg.readUInt8() );
    EXPECT_EQ( 0x02, msg.readUInt8() );
    EXPECT_EQ( 0x03, msg.readUInt8() );
}

TEST_F( ReadBufferTest, readUInt16NtoH )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02, 0x03, };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_EQ( 0x0001, msg.readUInt16NtoH() );
    EXPECT_EQ( 0x0203, msg.readUInt16NtoH() );
}

TEST_F( ReadBufferTest, readUInt32NtoH )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02, 0x03, 0x84, 0x05, 0x06, 0x07 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_EQ( 0x00010203u, msg.readUInt32NtoH() );
    EXPECT_EQ( 0x84050607u, msg.readUInt32NtoH() );
}

TEST_F( ReadBufferTest, readBuffer )
{
    PacketData buf = { 0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07 };
    sig0::ReadBuffer msg( buf );

    PacketData dst;
    EXPECT_EQ( 3, msg.readBuffer( dst, 3 ) );
    ASSERT_EQ( 3, dst.size() );
    EXPECT_EQ( 0x00, dst[0] );
    EXPECT_EQ( 0x01, dst[1] );
    EXPECT_EQ( 0x02, dst[2] );

    EXPECT_EQ( 4, msg.readBuffer( dst, 4 ) );
    ASSERT_EQ( 4, dst.size() );
    EXPECT_EQ( 0x03, dst[0] );
    EXPECT_EQ( 0x06, dst[3] );
}

TEST_F( ReadBufferTest, readBuffer_from_short_buffer )
{
    PacketData buf = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf );

    PacketData dst;
    EXPECT_EQ( 3, msg.readBuffer( dst, 5 ) );
    EXPECT_EQ( 3, dst.size() );
    EXPECT_EQ( 0, msg.readBuffer( dst, 5 ) );
    EXPECT_TRUE( dst.empty() );
}

TEST_F( ReadBufferTest, checkOutOfBound_uint8 )
{
    uint8_t buf[] = { 0x00, 0x01 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_NO_THROW( { msg.readUInt8(); } );
    EXPECT_NO_THROW( { msg.readUInt8(); } );
    EXPECT_THROW( { msg.readUInt8(); }, sig0::FormatError );
}

TEST_F( ReadBufferTest, checkOutOfBound_uint16 )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_NO_THROW( { msg.readUInt16NtoH(); } );
    EXPECT_THROW( { msg.readUInt16NtoH(); }, sig0::FormatError );
}

TEST_F( ReadBufferTest, checkOutOfBound_uint32 )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_THROW( { msg.readUInt32NtoH(); }, sig0::FormatError );
}

TEST_F( ReadBufferTest, skip )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    msg.skip( 2 );
    EXPECT_EQ( 2, msg.getPosition() );
    EXPECT_EQ( 0x02, msg.readUInt8() );
    EXPECT_THROW( { msg.skip( 1 ); }, sig0::FormatError );
}

TEST_F( ReadBufferTest, seek )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    msg.seek( 1 );
    EXPECT_EQ( 0x01, msg.readUInt8() );
    msg.seek( 3 );
    EXPECT_EQ( 0, msg.getRemainedSize() );
    EXPECT_THROW( { msg.seek( 4 ); }, sig0::FormatError );
}

TEST_F( ReadBufferTest, getRemainedSize )
{
    uint8_t buf[] = { 0x00, 0x01, 0x02 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_EQ( 3, msg.getRemainedSize() );
    msg.readUInt16NtoH();
    EXPECT_EQ( 1, msg.getRemainedSize() );
    msg.readUInt8();
    EXPECT_EQ( 0, msg.getRemainedSize() );
}

TEST_F( ReadBufferTest, readDomainname )
{
    uint8_t buf[] = { 3, 'c', 'o', 'm', 0, 7, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0xc0, 0x00, 0x12, 0x34 };
    sig0::ReadBuffer msg( buf, buf + sizeof( buf ) );

    EXPECT_EQ( sig0::Domainname( "com" ), msg.readDomainname() );
    EXPECT_EQ( sig0::Domainname( "example.com" ), msg.readDomainname() );
    EXPECT_EQ( 0x1234, msg.readUInt16NtoH() );
    EXPECT_THROW( { msg.readDomainname(); }, sig0::FormatError );
}

int main( int argc, char **argv )
{
    ::testing::InitGoogleTest( &argc, argv );
    return RUN_ALL_TESTS();
}
