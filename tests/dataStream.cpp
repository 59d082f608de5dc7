/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#include <lunchbox/test.h>

#include <locus/buffer.h>
#include <locus/connection.h>
#include <locus/dataIStream.h>
#include <locus/dataOStream.h>
#include <locus/exception.h>
#include <locus/iCommand.h>
#include <locus/init.h>
#include <locus/nodeAddress.h>
#include <locus/oCommand.h>

#include <lunchbox/thread.h>

// Tests the functionality of the DataOStream and DataIStream

#define CONTAINER_SIZE LB_64KB

static const std::string _message( "So long, and thanks for all the fish" );
static const std::string _lorem( "Lorem ipsum dolor sit amet, consectetur adipiscing elit. Ut eget felis sed leo tincidunt dictum eu eu felis. Aenean aliquam augue nec elit tristique tempus. Pellentesque dignissim adipiscing tellus, ut porttitor nisl lacinia vel." );
static const uint32_t CMD_TEST = locus::CMD_KERNEL_CUSTOM;

namespace
{
void _write( locus::DataOStream& stream )
{
    int foo = 42;
    stream << foo;
    stream << 43.0f;
    stream << 44.0;

    std::vector< double > doubles;
    for( size_t i=0; i<CONTAINER_SIZE; ++i )
        doubles.push_back( static_cast< double >( i ));

    stream << doubles;
    stream << _message;

    uint8_t blob[128];
    for( size_t i=0; i < 128; ++i )
        blob[ i ] = uint8_t( i );
    stream << lunchbox::Array< uint8_t >( blob, 128 );

    locus::Strings strings;
    strings.push_back( _message );
    strings.push_back( _lorem );
    strings.push_back( std::string( ));
    stream << strings;

    std::map< std::string, int32_t > map;
    map[ "one" ] = 1;
    map[ "two" ] = 2;
    stream << map;

    stream << locus::OID( 0x1234567890abcdefull, 0xfedcba0987654321ull );
    stream << locus::NodeAddress( "node1.example.com", 4242 );
}

void _read( locus::DataIStream& stream )
{
    int foo;
    stream >> foo;
    TESTINFO( foo == 42, foo );

    float fFoo;
    stream >> fFoo;
    TEST( fFoo == 43.f );

    double dFoo;
    stream >> dFoo;
    TEST( dFoo == 44.0 );

    std::vector< double > doubles;
    stream >> doubles;
    TEST( doubles.size() == CONTAINER_SIZE );
    for( size_t i=0; i<CONTAINER_SIZE; ++i )
        TEST( doubles[i] == static_cast< double >( i ));

    std::string message;
    stream >> message;
    TEST( message.length() == _message.length() );
    TESTINFO( message == _message,
              '\'' <<  message << "' != '" << _message << '\'' );

    uint8_t blob[128] = { 0 };
    stream >> lunchbox::Array< uint8_t >( blob, 128 );
    for( size_t i=0; i < 128; ++i )
        TEST( blob[ i ] == uint8_t( i ));

    const locus::Strings strings = stream.read< locus::Strings >();
    TEST( strings.size() == 3 );
    TEST( strings[0] == _message );
    TEST( strings[1] == _lorem );
    TEST( strings[2].empty( ));

    std::map< std::string, int32_t > map;
    stream >> map;
    TEST( map.size() == 2 );
    TEST( map[ "one" ] == 1 );
    TEST( map[ "two" ] == 2 );

    const locus::OID oid = stream.read< locus::OID >();
    TEST( oid == locus::OID( 0x1234567890abcdefull, 0xfedcba0987654321ull ));

    const locus::NodeAddress address = stream.read< locus::NodeAddress >();
    TESTINFO( address == locus::NodeAddress( "node1.example.com", 4242 ),
              address );
    TEST( !stream.hasData( ));
}

class Sender : public lunchbox::Thread
{
public:
    explicit Sender( locus::ConnectionPtr listener )
        : _listener( listener )
    {}

protected:
    void run() override
    {
        locus::ConnectionPtr connection = _listener->acceptSync();
        TEST( connection );
        TEST( connection->isConnected( ));

        locus::OCommand command( CMD_TEST );
        _write( command );
        TEST( command.send( connection ));

        // a second, empty command on the same connection
        locus::OCommand empty( CMD_TEST + 1 );
        TEST( empty.send( connection ));
        connection->close();
    }

private:
    locus::ConnectionPtr _listener;
};
}

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));

    // in-memory round trip
    {
        locus::DataOStream out;
        _write( out );
        const locus::Snapshot data = out.toSnapshot();
        TEST( data.size() == out.getSize( ));

        locus::DataIStream in( data );
        _read( in );

        // reading past the end fails without touching the output
        uint32_t value = 17;
        try
        {
            in >> value;
            TEST( false );
        }
        catch( const locus::Exception& e )
        {
            TESTINFO( e.getType() == locus::Exception::DESERIALIZATION, e );
        }
        TEST( value == 17 );

        // a corrupt element count is rejected before allocating
        locus::DataOStream corrupt;
        corrupt << uint64_t( 1ull << 60 );
        locus::DataIStream corruptIn( corrupt.toSnapshot( ));
        try
        {
            corruptIn.read< std::vector< double > >();
            TEST( false );
        }
        catch( const locus::Exception& e )
        {
            TESTINFO( e.getType() == locus::Exception::DESERIALIZATION, e );
        }

        out.reset();
        TEST( out.getSize() == 0 );
    }

    // framed commands over a TCP connection
    locus::ConnectionPtr listener =
        locus::Connection::create( locus::NodeAddress( "127.0.0.1", 0 ));
    TEST( listener->listen( ));
    TEST( listener->isListening( ));
    const locus::NodeAddress address = listener->getAddress();
    TESTINFO( address.port != 0, address );

    Sender sender( listener );
    TEST( sender.start( ));

    locus::ConnectionPtr connection = locus::Connection::create( address );
    TEST( connection->connect( ));

    locus::BufferPtr buffer = locus::ICommand::readBuffer( connection );
    TEST( buffer );
    locus::ICommand command( connection, buffer );
    TESTINFO( command.isValid(), command );
    TESTINFO( command.getCommand() == CMD_TEST, command );
    TEST( command.getSize() == buffer->getSize( ));
    _read( command );

    buffer = locus::ICommand::readBuffer( connection );
    TEST( buffer );
    locus::ICommand empty( connection, buffer );
    TESTINFO( empty.getCommand() == CMD_TEST + 1, empty );
    TEST( empty.getSize() == locus::OCommand::getSize( ));
    TEST( !empty.hasData( ));

    // peer closed the connection
    TEST( !locus::ICommand::readBuffer( connection ));

    TEST( sender.join( ));
    connection->close();
    listener->close();
    TEST( listener->isClosed( ));

    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
