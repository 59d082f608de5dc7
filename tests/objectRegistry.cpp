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

// Tests object creation, lookup and migration installs of the registry

#include "testObjects.h"

#include <lunchbox/test.h>

#include <locus/hostedObject.h>
#include <locus/init.h>
#include <locus/objectRegistry.h>

using test::getError;

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));

    test::Factory factory;
    test::FlakyDirectoryPtr directory = new test::FlakyDirectory;
    const locus::NodeAddress host( "node1", 4242 );
    const locus::Strings noArgs;
    {
        locus::ObjectRegistry registry( host, directory, factory );
        TEST( registry.size() == 0 );

        locus::Strings args( 1, "7" );
        const locus::OID oid = registry.create( "Counter", args );
        TEST( registry.size() == 1 );
        TEST( directory->resolve( oid ) == host );
        TEST( int32_t( factory.nObjects ) == 1 );

        locus::HostedObjectPtr hosted = registry.lookup( oid );
        TEST( hosted->isActive( ));
        TEST( hosted->invoke( "get", noArgs ) == "7" );
        TEST( registry.find( oid ) == hosted );

        const locus::OID unknown = servus::make_UUID();
        TEST( !registry.find( unknown ));
        TEST( getError( boost::bind( &locus::ObjectRegistry::lookup,
                                     &registry, unknown )) ==
              locus::Exception::NOT_FOUND );

        // failed creations leave no object behind
        TEST( getError( boost::bind( &locus::ObjectRegistry::create,
                                     &registry, std::string( "Unknown" ),
                                     noArgs )) ==
              locus::Exception::INSTANTIATION );

        const locus::Strings failArgs( 1, "fail" );
        TEST( getError( boost::bind( &locus::ObjectRegistry::create,
                                     &registry, std::string( "Counter" ),
                                     failArgs )) ==
              locus::Exception::INSTANTIATION );

        const locus::Strings panicArgs( 1, "panic" );
        TEST( getError( boost::bind( &locus::ObjectRegistry::create,
                                     &registry, std::string( "Counter" ),
                                     panicArgs )) ==
              locus::Exception::INSTANTIATION );
        TEST( int32_t( factory.nObjects ) == 1 );

        directory->failAllocate = true;
        TEST( getError( boost::bind( &locus::ObjectRegistry::create,
                                     &registry, std::string( "Counter" ),
                                     noArgs )) ==
              locus::Exception::ALLOCATION );
        directory->failAllocate = false;

        TEST( registry.size() == 1 );
        TEST( directory->local->getNumObjects() == 1 );
        TEST( int32_t( factory.nObjects ) == 1 );

        // install a snapshot under the same identifier on another registry
        const locus::Snapshot snapshot = hosted->freeze();
        locus::ObjectRegistry other( locus::NodeAddress( "node2", 4242 ),
                                     directory, factory );
        other.insert( oid, snapshot );
        TEST( other.size() == 1 );
        TEST( other.lookup( oid )->isActive( ));
        TEST( other.lookup( oid )->invoke( "get", noArgs ) == "7" );

        TEST( getError( boost::bind( &locus::ObjectRegistry::insert, &other,
                                     oid, snapshot )) ==
              locus::Exception::DUPLICATE );
        TEST( other.size() == 1 );
        TEST( other.lookup( oid )->invoke( "get", noArgs ) == "7" );

        locus::Snapshot corrupt( snapshot );
        corrupt[0] ^= 0xff;
        const locus::OID second = servus::make_UUID();
        TEST( getError( boost::bind( &locus::ObjectRegistry::insert, &other,
                                     second, corrupt )) ==
              locus::Exception::DESERIALIZATION );
        TEST( !other.find( second ));

        registry.remove( oid );
        TEST( registry.size() == 0 );
        TEST( !registry.find( oid ));
        registry.remove( oid );
        TEST( registry.size() == 0 );

        // the holder of a removed object can neither invoke nor freeze it
        TEST( hosted->getState() == locus::HostedObject::STATE_INACTIVE );
        TEST( getError( boost::bind( &locus::HostedObject::freeze,
                                     hosted.get( ))) ==
              locus::Exception::INVALID_STATE );
        TEST( getError( boost::bind( &locus::HostedObject::invoke,
                                     hosted.get(), std::string( "get" ),
                                     noArgs )) ==
              locus::Exception::INVALID_STATE );
        TEST( getError( boost::bind( &locus::HostedObject::thaw,
                                     hosted.get( ))) ==
              locus::Exception::INVALID_STATE );
        hosted = 0;
        TEST( int32_t( factory.nObjects ) == 1 );

        for( size_t i = 0; i < 10; ++i )
            registry.create( "Counter", noArgs );
        const locus::OIDs oids = registry.getIDs();
        TEST( oids.size() == 10 );
        const std::set< locus::OID > unique( oids.begin(), oids.end( ));
        TEST( unique.size() == 10 );
        TEST( unique.find( oid ) == unique.end( ));
        TEST( int32_t( factory.nObjects ) == 11 );

        registry.clear();
        TEST( registry.size() == 0 );
        TEST( int32_t( factory.nObjects ) == 1 );
    }
    TEST( int32_t( factory.nObjects ) == 0 );

    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
