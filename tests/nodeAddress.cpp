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

#include <locus/global.h>
#include <locus/init.h>
#include <locus/nodeAddress.h>

#include <set>

// Tests node address parsing and the global attribute serialization

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));

    locus::NodeAddress address;
    TEST( !address.isValid( ));
    TEST( address.fromString( "node1:1234" ));
    TEST( address.isValid( ));
    TESTINFO( address.hostname == "node1", address );
    TESTINFO( address.port == 1234, address );
    TESTINFO( address.toString() == "node1:1234", address );

    locus::NodeAddress parsed;
    TEST( parsed.fromString( address.toString( )));
    TEST( parsed == address );

    locus::Global::setDefaultPort( 4321 );
    TEST( address.fromString( "node2" ));
    TESTINFO( address.port == 4321, address );
    TEST( address != parsed );

    // invalid strings leave the address untouched
    TEST( !address.fromString( "" ));
    TEST( !address.fromString( "node3:" ));
    TEST( !address.fromString( ":42" ));
    TEST( !address.fromString( "node3:port" ));
    TEST( !address.fromString( "node3:0" ));
    TEST( !address.fromString( "node3:70000" ));
    TESTINFO( address == locus::NodeAddress( "node2", 4321 ), address );

    std::set< locus::NodeAddress > addresses;
    addresses.insert( locus::NodeAddress( "b", 1 ));
    addresses.insert( locus::NodeAddress( "a", 2 ));
    addresses.insert( locus::NodeAddress( "a", 1 ));
    addresses.insert( locus::NodeAddress( "a", 1 ));
    TEST( addresses.size() == 3 );
    TEST( *addresses.begin() == locus::NodeAddress( "a", 1 ));
    TEST( *addresses.rbegin() == locus::NodeAddress( "b", 1 ));

    // global attributes
    const int32_t retries =
        locus::Global::getIAttribute( locus::Global::IATTR_INVOKE_RETRIES );
    TEST( retries > 0 );
    TEST( locus::Global::getTimeout() > 0 );

    std::string globals;
    locus::Global::toString( globals );
    locus::Global::setIAttribute( locus::Global::IATTR_INVOKE_RETRIES, 99 );
    TEST( locus::Global::fromString( globals ));
    TESTINFO( locus::Global::getIAttribute(
                  locus::Global::IATTR_INVOKE_RETRIES ) == retries, globals );

    TEST( !locus::Global::fromString( "" ));
    TEST( !locus::Global::fromString( "##1#2#" ));
    TESTINFO( locus::Global::getIAttribute(
                  locus::Global::IATTR_INVOKE_RETRIES ) == retries, globals );

    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
