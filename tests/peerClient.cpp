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

// Tests location caching and retries of the client-side invocation path

#include "testObjects.h"

#include <lunchbox/clock.h>
#include <lunchbox/test.h>

#include <locus/hostedObject.h>
#include <locus/init.h>
#include <locus/kernelServer.h>
#include <locus/objectRegistry.h>
#include <locus/peerClient.h>

using test::getError;

int main( int argc, char **argv )
{
    TEST( locus::init( argc, argv ));
    locus::Global::setIAttribute( locus::Global::IATTR_INVOKE_RETRIES, 3 );

    test::Factory factory;
    locus::LocalDirectoryPtr directory = new locus::LocalDirectory;
    test::Cluster cluster( directory, factory );
    locus::KernelServerPtr nodeA = cluster.add( "nodeA" );
    locus::KernelServerPtr nodeB = cluster.add( "nodeB" );
    TEST( directory->getNodes( std::string( )).size() == 2 );

    locus::PeerClient client( directory,
                              boost::bind( &test::Cluster::connect, &cluster,
                                           _1 ));
    const locus::Strings noArgs;
    const locus::Strings one( 1, "1" );
    const std::string add( "add" );

    // creation caches the location
    const locus::OID oid =
        client.createObject( nodeA->getAddress(), "Counter", noArgs );
    TEST( client.resolve( oid ) == nodeA->getAddress( ));
    TEST( client.invoke( oid, "add", one ) == "1" );
    TEST( client.invoke( oid, "get", noArgs ) == "1" );
    TEST( nodeA->getRegistry().size() == 1 );

    // a stale cache entry is corrected using the directory
    nodeA->moveObject( oid, nodeB->getAddress( ));
    TEST( directory->resolve( oid ) == nodeB->getAddress( ));
    TEST( client.resolve( oid ) == nodeA->getAddress( ));
    TEST( client.invoke( oid, "add", one ) == "2" );
    TEST( client.resolve( oid ) == nodeB->getAddress( ));

    // application errors are reported, not retried
    TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                 std::string( "fail" ), noArgs )) ==
          locus::Exception::REMOTE_INVOCATION );
    TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                 std::string( "unknown" ), noArgs )) ==
          locus::Exception::REMOTE_INVOCATION );
    TEST( client.invoke( oid, "get", noArgs ) == "2" );

    // unknown identifiers fail in the directory
    const locus::OID unknown = servus::make_UUID();
    TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, unknown,
                                 std::string( "get" ), noArgs )) ==
          locus::Exception::UNKNOWN_OID );

    // unreachable hosts exhaust the retries
    cluster.setReachable( nodeB->getAddress(), false );
    client.clear();
    TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                 add, one )) ==
          locus::Exception::NOT_FOUND );
    TEST( getError( boost::bind( &locus::PeerClient::getPeer, &client,
                                 nodeB->getAddress( ))) ==
          locus::Exception::UNREACHABLE );
    cluster.setReachable( nodeB->getAddress(), true );
    TEST( client.invoke( oid, "get", noArgs ) == "2" );

    // frozen objects are retried until the retries are exhausted
    locus::HostedObjectPtr hosted = nodeB->getRegistry().lookup( oid );
    hosted->freeze();
    TEST( getError( boost::bind( &locus::PeerClient::invoke, &client, oid,
                                 add, one )) ==
          locus::Exception::NOT_FOUND );
    nodeB->reactivateObject( oid );
    TEST( hosted->isActive( ));
    TEST( client.invoke( oid, "add", one ) == "3" );
    hosted = 0;

    // moves are forwarded to the current host
    client.moveObject( oid, nodeA->getAddress( ));
    TEST( client.resolve( oid ) == nodeA->getAddress( ));
    TEST( nodeA->getRegistry().size() == 1 );
    TEST( nodeB->getRegistry().size() == 0 );
    TEST( client.invoke( oid, "get", noArgs ) == "3" );

    // a stale location is corrected when moving
    client.setLocation( oid, nodeB->getAddress( ));
    client.moveObject( oid, nodeB->getAddress( ));
    TEST( directory->resolve( oid ) == nodeB->getAddress( ));
    TEST( nodeB->getRegistry().size() == 1 );
    TEST( client.invoke( oid, "get", noArgs ) == "3" );

    // transfers to an unreachable node are retried after the transfer delay
    locus::Global::setIAttribute( locus::Global::IATTR_TRANSFER_RETRIES, 2 );
    locus::Global::setIAttribute(
        locus::Global::IATTR_DIRECTORY_RETRY_DELAY, 10000 );
    cluster.setReachable( nodeA->getAddress(), false );
    lunchbox::Clock clock;
    TEST( getError( boost::bind( &locus::PeerClient::transferObject, &client,
                                 nodeA->getAddress(), oid,
                                 locus::Snapshot( ))) ==
          locus::Exception::UNREACHABLE );
    TESTINFO( clock.getTime64() < 5000, clock.getTime64( ));
    cluster.setReachable( nodeA->getAddress(), true );
    locus::Global::setIAttribute(
        locus::Global::IATTR_DIRECTORY_RETRY_DELAY, 1 );

    // peers are cached and released
    locus::PeerPtr peer = client.getPeer( nodeA->getAddress( ));
    TEST( peer.get() == static_cast< locus::Peer* >( nodeA.get( )));
    TEST( client.getPeer( nodeA->getAddress( )) == peer );
    client.releasePeer( nodeA->getAddress( ));
    client.clear();
    TEST( client.resolve( oid ) == nodeB->getAddress( ));
    peer = 0;

    client.clear();
    TEST( locus::exit( ));
    return EXIT_SUCCESS;
}
