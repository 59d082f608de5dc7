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

// Tests identifier allocation, resolution and node registration

#include "testObjects.h"

#include <lunchbox/test.h>

#include <locus/init.h>
#include <locus/localDirectory.h>

#include <set>

using test::getError;

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));

    locus::LocalDirectoryPtr directory = new locus::LocalDirectory;
    const locus::NodeAddress node1( "node1", 4242 );
    const locus::NodeAddress node2( "node2", 4242 );

    std::set< locus::OID > oids;
    for( size_t i = 0; i < 1000; ++i )
    {
        const locus::OID oid = directory->allocate( i % 2 ? node1 : node2 );
        TEST( oid != locus::OID( ));
        TEST( oids.insert( oid ).second );
    }
    TEST( directory->getNumObjects() == 1000 );
    TEST( directory->getObjects( node1 ).size() == 500 );
    TEST( directory->getObjects( node2 ).size() == 500 );

    const locus::OID oid = directory->allocate( node1 );
    TEST( directory->resolve( oid ) == node1 );
    directory->updateLocation( oid, node2 );
    TEST( directory->resolve( oid ) == node2 );
    directory->updateLocation( oid, node2 );
    TEST( directory->resolve( oid ) == node2 );
    TEST( directory->getObjects( node2 ).size() == 501 );

    const locus::OID unknown = servus::make_UUID();
    TEST( getError( boost::bind( &locus::LocalDirectory::resolve,
                                 directory.get(), unknown )) ==
          locus::Exception::UNKNOWN_OID );
    TEST( getError( boost::bind( &locus::LocalDirectory::updateLocation,
                                 directory.get(), unknown, node1 )) ==
          locus::Exception::UNKNOWN_OID );
    TEST( directory->getNumObjects() == 1001 );

    // node registry
    TEST( directory->getNodes( std::string( )).empty( ));
    directory->registerNode( node1, "east" );
    directory->registerNode( node2, "west" );
    directory->registerNode( locus::NodeAddress( "node3", 4242 ), "east" );

    TEST( directory->getNodes( std::string( )).size() == 3 );
    const locus::NodeAddresses east = directory->getNodes( "east" );
    TEST( east.size() == 2 );
    TEST( east[0] == node1 );
    TEST( directory->getNodes( "west" ).size() == 1 );
    TEST( directory->getNodes( "north" ).empty( ));

    // registering again moves the node to the new region
    directory->registerNode( node2, "east" );
    TEST( directory->getNodes( "east" ).size() == 3 );
    TEST( directory->getNodes( "west" ).empty( ));

    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
